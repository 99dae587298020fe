#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <unordered_set>

#include "rankbpe/config.hpp"
#include "rankbpe/encoding.hpp"
#include "rankbpe/errors.hpp"
#include "rankbpe/load.hpp"
#include "rankbpe/models.hpp"
#include "rankbpe/registry.hpp"

namespace py = pybind11;
using namespace rankbpe;

namespace {

// "all" or a collection of strings, as accepted by the allowed_special and
// disallowed_special keyword arguments.
SpecialSet ToSpecialSet(const py::object& obj) {
  if (obj.is_none()) {
    return SpecialSet::None();
  }
  if (py::isinstance<py::str>(obj)) {
    const auto s = obj.cast<std::string>();
    if (s == "all") {
      return SpecialSet::All();
    }
    throw py::value_error("special token set must be 'all' or a collection of strings, got '" + s + "'");
  }
  std::unordered_set<std::string> tokens;
  for (const auto& item : obj) {
    tokens.insert(item.cast<std::string>());
  }
  return SpecialSet(std::move(tokens));
}

Config MakeConfig(const std::string& vocab_dir) {
  Config cfg = LoadConfig();
  if (!vocab_dir.empty()) {
    cfg.vocab_dir = vocab_dir;
  }
  return cfg;
}

}  // namespace

PYBIND11_MODULE(pyrankbpe, m) {
  auto base = py::register_exception<Error>(m, "RankBpeError", PyExc_ValueError);
  py::register_exception<DisallowedSpecialToken>(m, "DisallowedSpecialToken", base.ptr());
  py::register_exception<UnknownToken>(m, "UnknownToken", base.ptr());
  py::register_exception<VocabularyError>(m, "VocabularyError", base.ptr());
  py::register_exception<UnknownEncoding>(m, "UnknownEncoding", base.ptr());
  py::register_exception<UnknownModel>(m, "UnknownModel", base.ptr());
  py::register_exception<EncodingError>(m, "EncodingError", base.ptr());

  py::class_<EncodingOptions>(m, "EncodingOptions")
      .def(py::init<>())
      .def_readwrite("use_cache", &EncodingOptions::use_cache)
      .def_readwrite("cache_max_entries", &EncodingOptions::cache_max_entries)
      .def_readwrite("cache_shards", &EncodingOptions::cache_shards)
      .def_readwrite("threads", &EncodingOptions::threads);

  py::class_<Encoding, std::shared_ptr<Encoding>>(m, "Encoding")
      .def(py::init([](const std::string& name, const std::string& pat_str, const py::dict& mergeable_ranks,
                       const std::unordered_map<std::string, Rank>& special_tokens, EncodingOptions options) {
             ByteRankMap ranks;
             ranks.reserve(mergeable_ranks.size());
             for (const auto& kv : mergeable_ranks) {
               ranks.emplace(kv.first.cast<py::bytes>().cast<std::string>(), kv.second.cast<Rank>());
             }
             return std::make_shared<Encoding>(name, RankTable(std::move(ranks)), SpecialTokenTable(special_tokens),
                                               pat_str, options);
           }),
           py::arg("name"), py::arg("pat_str"), py::arg("mergeable_ranks"), py::arg("special_tokens"),
           py::arg("options") = EncodingOptions{})
      .def_property_readonly("name", &Encoding::Name)
      .def_property_readonly("pat_str", &Encoding::pattern)
      .def_property_readonly("options", &Encoding::options)
      .def_property_readonly("n_vocab", &Encoding::VocabSize)
      .def_property_readonly("max_token_value", &Encoding::MaxTokenValue)
      .def_property_readonly("eot_token", &Encoding::EotToken)
      .def_property_readonly("special_tokens_set", &Encoding::SpecialTokens)
      .def(
          "encode",
          [](const Encoding& self, const std::string& text, const py::object& allowed_special,
             const py::object& disallowed_special) {
            const SpecialSet allowed = ToSpecialSet(allowed_special);
            const SpecialSet disallowed = ToSpecialSet(disallowed_special);
            py::gil_scoped_release release;
            return self.Encode(text, allowed, disallowed);
          },
          py::arg("text"), py::kw_only(), py::arg("allowed_special") = py::none(),
          py::arg("disallowed_special") = py::str("all"))
      .def(
          "encode_ordinary",
          [](const Encoding& self, const std::string& text) {
            py::gil_scoped_release release;
            return self.EncodeOrdinary(text);
          },
          py::arg("text"))
      .def(
          "encode_batch",
          [](const Encoding& self, const std::vector<std::string>& texts, std::size_t num_threads,
             const py::object& allowed_special, const py::object& disallowed_special) {
            const SpecialSet allowed = ToSpecialSet(allowed_special);
            const SpecialSet disallowed = ToSpecialSet(disallowed_special);
            py::gil_scoped_release release;
            return self.EncodeBatch(texts, allowed, disallowed, num_threads);
          },
          py::arg("text"), py::kw_only(), py::arg("num_threads") = 0, py::arg("allowed_special") = py::none(),
          py::arg("disallowed_special") = py::str("all"))
      .def(
          "encode_ordinary_batch",
          [](const Encoding& self, const std::vector<std::string>& texts, std::size_t num_threads) {
            py::gil_scoped_release release;
            return self.EncodeOrdinaryBatch(texts, num_threads);
          },
          py::arg("text"), py::kw_only(), py::arg("num_threads") = 0)
      .def("encode_single_token",
           [](const Encoding& self, const py::bytes& bytes) { return self.EncodeSingleToken(std::string(bytes)); })
      .def(
          "decode",
          [](const Encoding& self, const std::vector<Rank>& tokens, const std::string& errors) {
            if (errors == "replace") {
              return self.DecodeLossy(tokens);
            }
            if (errors != "strict") {
              throw py::value_error("errors must be 'strict' or 'replace'");
            }
            // Invalid UTF-8 surfaces as UnicodeDecodeError on conversion to str.
            return self.Decode(tokens);
          },
          py::arg("tokens"), py::arg("errors") = "replace")
      .def("decode_bytes",
           [](const Encoding& self, const std::vector<Rank>& tokens) { return py::bytes(self.Decode(tokens)); })
      .def("decode_batch", &Encoding::DecodeBatch, py::arg("batch"), py::arg("num_threads") = 0)
      .def("decode_single_token_bytes",
           [](const Encoding& self, Rank token) { return py::bytes(self.DecodeSingleTokenBytes(token)); })
      .def(
          "count",
          [](const Encoding& self, const std::string& text, const py::object& allowed_special,
             const py::object& disallowed_special) {
            const SpecialSet allowed = ToSpecialSet(allowed_special);
            const SpecialSet disallowed = ToSpecialSet(disallowed_special);
            py::gil_scoped_release release;
            return self.Count(text, allowed, disallowed);
          },
          py::arg("text"), py::kw_only(), py::arg("allowed_special") = py::none(),
          py::arg("disallowed_special") = py::str("all"))
      .def(
          "count_ordinary",
          [](const Encoding& self, const std::string& text) {
            py::gil_scoped_release release;
            return self.CountOrdinary(text);
          },
          py::arg("text"))
      .def("is_special_token", &Encoding::IsSpecialToken)
      .def("token_byte_values",
           [](const Encoding& self) {
             py::list out;
             for (const auto& bytes : self.TokenByteValues()) {
               out.append(py::bytes(bytes));
             }
             return out;
           })
      .def("cache_size", &Encoding::CacheSize)
      .def("clear_cache", &Encoding::ClearCache)
      .def("__repr__", [](const Encoding& self) { return "<Encoding '" + self.Name() + "'>"; });

  m.def(
      "get_encoding",
      [](const std::string& name, const std::string& vocab_dir) {
        return std::const_pointer_cast<Encoding>(GetEncoding(name, MakeConfig(vocab_dir)));
      },
      py::arg("encoding_name"), py::arg("vocab_dir") = "");
  m.def(
      "encoding_for_model",
      [](const std::string& model, const std::string& vocab_dir) {
        return std::const_pointer_cast<Encoding>(EncodingForModel(model, MakeConfig(vocab_dir)));
      },
      py::arg("model_name"), py::arg("vocab_dir") = "");
  m.def("encoding_name_for_model", &EncodingNameForModel, py::arg("model_name"));
  m.def("list_encoding_names", &ListEncodingNames);
  m.def("list_supported_models", &ListSupportedModels);
  m.def("load_tiktoken_bpe", [](const std::string& path) {
    py::dict out;
    for (const auto& [bytes, rank] : LoadTiktokenBpe(path)) {
      out[py::bytes(bytes)] = rank;
    }
    return out;
  });
}
