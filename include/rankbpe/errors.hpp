#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace rankbpe {

// Base of every exception thrown by the library.
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// A disallowed special token occurs literally in the text passed to Encode.
class DisallowedSpecialToken : public Error {
 public:
  DisallowedSpecialToken(std::string token, std::size_t offset);

  [[nodiscard]] const std::string& token() const { return token_; }
  [[nodiscard]] std::size_t offset() const { return offset_; }

 private:
  std::string token_;
  std::size_t offset_;
};

// Decode was given an id that is neither an ordinary nor a special rank.
class UnknownToken : public Error {
 public:
  explicit UnknownToken(std::uint32_t token);

  [[nodiscard]] std::uint32_t token() const { return token_; }

 private:
  std::uint32_t token_;
};

// The merge engine produced a span that is not in the rank table. Only a
// defective vocabulary can cause this.
class InvariantViolation : public Error {
 public:
  explicit InvariantViolation(const std::string& what) : Error("invariant violation: " + what) {}
};

class VocabularyError : public Error {
 public:
  explicit VocabularyError(const std::string& what) : Error("vocabulary error: " + what) {}
};

class UnknownEncoding : public Error {
 public:
  explicit UnknownEncoding(const std::string& name) : Error("unknown encoding: " + name), name_(name) {}

  [[nodiscard]] const std::string& name() const { return name_; }

 private:
  std::string name_;
};

class UnknownModel : public Error {
 public:
  explicit UnknownModel(const std::string& model) : Error("unknown model: " + model), model_(model) {}

  [[nodiscard]] const std::string& model() const { return model_; }

 private:
  std::string model_;
};

class EncodingError : public Error {
 public:
  explicit EncodingError(const std::string& what) : Error("encoding error: " + what) {}
};

class PatternError : public Error {
 public:
  explicit PatternError(const std::string& what) : Error("pattern error: " + what) {}
};

}  // namespace rankbpe
