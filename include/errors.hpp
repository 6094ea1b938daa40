#pragma once

#include <stdexcept>
#include <string>

// OCR engine missing or crashed; fatal for the file being converted.
class OcrEngineError : public std::runtime_error {
public:
  explicit OcrEngineError(const std::string& what) : std::runtime_error(what) {}
};

// Input is not a PDF, JPG or PNG.
class UnsupportedInputError : public std::runtime_error {
public:
  explicit UnsupportedInputError(const std::string& what) : std::runtime_error(what) {}
};

class RasterizeError : public std::runtime_error {
public:
  explicit RasterizeError(const std::string& what) : std::runtime_error(what) {}
};
