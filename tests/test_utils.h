#pragma once

#include <string>

#include "jpx/jpx.h"

/// Parses expected_json and checks deep equality, printing both sides on mismatch.
void expect_json(const jpx::Value& actual, const std::string& expected_json, const std::string& message);
/// Escapes " and \ so JSON text can be embedded in a double-quoted expression literal.
std::string quote_for_expression(const std::string& json_text);
