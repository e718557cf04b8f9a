#pragma once

#include <string>
#include <vector>

namespace recall::resources {

inline const std::vector<std::string>& default_topics() {
  static const std::vector<std::string> topics = {
      "Neuroplasticidade e aprendizado motor",
      "O impacto do microbioma intestinal na saúde mental",
      "Entropia e a segunda lei da termodinâmica",
      "Mecanismos de edição genética CRISPR-Cas9",
      "Matéria escura e a expansão do universo",
      "Epigenética e herança transgeracional",
      "Computação quântica e criptografia",
      "A hipótese de Gaia e regulação planetária",
      "Fusão nuclear como fonte de energia limpa",
      "O papel dos telômeros no envelhecimento celular"};
  return topics;
}

} // namespace recall::resources
