// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace datamig {

enum class DecodingError {
    kNullDocument,   // the stored document is SQL NULL or JSON null
    kMalformedJson,  // the document is not valid JSON
    kInvalidField,   // a required key is missing or has an unexpected value
};

class DecodingException : public std::runtime_error {
  public:
    explicit DecodingException(DecodingError err, const std::string& message = "");

    DecodingError err() const noexcept { return err_; }

  private:
    DecodingError err_;
};

}  // namespace datamig
