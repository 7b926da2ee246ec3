#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "subtok/config.hpp"
#include "subtok/error.hpp"
#include "subtok/parallel.hpp"
#include "subtok/tokenizer.hpp"

namespace py = pybind11;
using namespace subtok;

PYBIND11_MODULE(pysubtok, m) {
  py::register_exception<TokenizerError>(m, "TokenizerError", PyExc_RuntimeError);

  py::enum_<TruncationStrategy>(m, "TruncationStrategy")
      .value("longest_first", TruncationStrategy::longest_first)
      .value("only_first", TruncationStrategy::only_first)
      .value("only_second", TruncationStrategy::only_second)
      .value("do_not_truncate", TruncationStrategy::do_not_truncate);

  py::enum_<TokenizerFamily>(m, "TokenizerFamily")
      .value("base", TokenizerFamily::base)
      .value("bert", TokenizerFamily::bert)
      .value("gpt2", TokenizerFamily::gpt2)
      .value("roberta", TokenizerFamily::roberta)
      .value("openai_gpt", TokenizerFamily::openai_gpt)
      .value("ctrl", TokenizerFamily::ctrl)
      .value("sentencepiece", TokenizerFamily::sentencepiece)
      .value("xlnet", TokenizerFamily::xlnet)
      .value("albert", TokenizerFamily::albert)
      .value("t5", TokenizerFamily::t5)
      .value("xlm_roberta", TokenizerFamily::xlm_roberta);

  py::enum_<Mask>(m, "Mask")
      .value("none", Mask::none)
      .value("whitespace", Mask::whitespace)
      .value("punctuation", Mask::punctuation)
      .value("cjk", Mask::cjk)
      .value("special", Mask::special)
      .value("begin", Mask::begin)
      .value("continuation", Mask::continuation)
      .value("unfinished", Mask::unfinished)
      .value("unknown", Mask::unknown);

  py::class_<Offset>(m, "Offset")
      .def_readonly("begin", &Offset::begin)
      .def_readonly("end", &Offset::end)
      .def("__repr__", [](const Offset& o) {
        return "Offset(" + std::to_string(o.begin) + ", " + std::to_string(o.end) + ")";
      });

  py::class_<TokensWithOffsets>(m, "TokensWithOffsets")
      .def_readonly("tokens", &TokensWithOffsets::tokens)
      .def_readonly("offsets", &TokensWithOffsets::offsets)
      .def_readonly("reference_offsets", &TokensWithOffsets::reference_offsets)
      .def_readonly("masks", &TokensWithOffsets::masks);

  py::class_<TokenizedInput>(m, "TokenizedInput")
      .def_readonly("token_ids", &TokenizedInput::token_ids)
      .def_readonly("segment_ids", &TokenizedInput::segment_ids)
      .def_readonly("special_tokens_mask", &TokenizedInput::special_tokens_mask)
      .def_readonly("overflowing_tokens", &TokenizedInput::overflowing_tokens)
      .def_readonly("num_truncated_tokens", &TokenizedInput::num_truncated_tokens)
      .def_readonly("token_offsets", &TokenizedInput::token_offsets)
      .def_readonly("reference_offsets", &TokenizedInput::reference_offsets)
      .def_readonly("mask", &TokenizedInput::mask);

  py::class_<TokenizerConfig>(m, "TokenizerConfig")
      .def(py::init<>())
      .def_readwrite("family", &TokenizerConfig::family)
      .def_readwrite("vocab_path", &TokenizerConfig::vocab_path)
      .def_readwrite("merges_path", &TokenizerConfig::merges_path)
      .def_readwrite("lower_case", &TokenizerConfig::lower_case)
      .def_readwrite("strip_accents", &TokenizerConfig::strip_accents)
      .def_readwrite("add_prefix_space", &TokenizerConfig::add_prefix_space)
      .def_readwrite("max_len", &TokenizerConfig::max_len)
      .def_readwrite("stride", &TokenizerConfig::stride)
      .def_readwrite("truncation", &TokenizerConfig::truncation)
      .def_readwrite("threads", &TokenizerConfig::threads)
      .def_readwrite("bpe_cache_capacity", &TokenizerConfig::bpe_cache_capacity)
      .def_readwrite("skip_special_tokens", &TokenizerConfig::skip_special_tokens)
      .def_readwrite("clean_up_tokenization_spaces", &TokenizerConfig::clean_up_tokenization_spaces);

  py::class_<Tokenizer>(m, "Tokenizer")
      .def("tokenize", &Tokenizer::Tokenize, py::arg("text"))
      .def("tokenize_with_offsets", &Tokenizer::TokenizeWithOffsets, py::arg("text"))
      .def("convert_tokens_to_ids",
           [](const Tokenizer& self, const std::vector<std::string>& tokens) {
             return self.ConvertTokensToIds(tokens);
           })
      .def(
          "encode",
          [](const Tokenizer& self, const std::string& text_a, std::optional<std::string> text_b,
             std::size_t max_len, TruncationStrategy strategy, std::size_t stride) {
            std::optional<std::string_view> second;
            if (text_b) second = *text_b;
            return self.Encode(text_a, second, max_len, strategy, stride);
          },
          py::arg("text_a"), py::arg("text_b") = py::none(), py::arg("max_len") = 512,
          py::arg("truncation") = TruncationStrategy::longest_first, py::arg("stride") = 0)
      .def(
          "decode",
          [](const Tokenizer& self, const std::vector<TokenId>& ids, bool skip_special_tokens,
             bool clean_up_tokenization_spaces) {
            return self.Decode(ids, skip_special_tokens, clean_up_tokenization_spaces);
          },
          py::arg("ids"), py::arg("skip_special_tokens") = false, py::arg("clean_up_tokenization_spaces") = true)
      .def_property_readonly("vocab_size", [](const Tokenizer& self) { return self.GetVocab().Size(); });

  py::class_<MultiThreadedTokenizer>(m, "MultiThreadedTokenizer")
      .def(py::init([](const Tokenizer& tk, std::size_t threads) { return MultiThreadedTokenizer(tk, threads); }),
           py::keep_alive<1, 2>(), py::arg("tokenizer"), py::arg("threads") = 0)
      .def("tokenize_list",
           [](const MultiThreadedTokenizer& self, const std::vector<std::string>& texts) {
             py::gil_scoped_release release;
             return self.TokenizeList(texts);
           })
      .def(
          "encode_list",
          [](const MultiThreadedTokenizer& self, const std::vector<std::string>& texts, std::size_t max_len,
             TruncationStrategy strategy, std::size_t stride) {
            py::gil_scoped_release release;
            return self.EncodeList(texts, max_len, strategy, stride);
          },
          py::arg("texts"), py::arg("max_len") = 512, py::arg("truncation") = TruncationStrategy::longest_first,
          py::arg("stride") = 0)
      .def(
          "decode_list",
          [](const MultiThreadedTokenizer& self, const std::vector<std::vector<TokenId>>& ids,
             bool skip_special_tokens, bool clean_up_tokenization_spaces) {
            py::gil_scoped_release release;
            return self.DecodeList(ids, skip_special_tokens, clean_up_tokenization_spaces);
          },
          py::arg("ids"), py::arg("skip_special_tokens") = false, py::arg("clean_up_tokenization_spaces") = true);

  m.def("create_tokenizer", &CreateTokenizer, py::arg("config"));
  m.def("parse_family", &ParseFamily);
}
