#pragma once

#ifdef __cplusplus
extern "C" {
#endif

/* Every call returns a malloc'd JSON envelope with "status" set to "ok" or
 * "error" (plus "message"); release it with recall_free_string. */

char *recall_set_storage_root(const char *path);
char *recall_load_profiles(const char *catalog_path);
char *recall_list_profiles(void);
char *recall_plan_test(const char *config_json);
char *recall_build_test(const char *plan_json, const char *content_json);
char *recall_tokenize(const char *text, const char *language);
char *recall_score_session(const char *request_json);
char *recall_history(void);
char *recall_clear_history(void);
void recall_free_string(char *ptr);

#ifdef __cplusplus
}
#endif
