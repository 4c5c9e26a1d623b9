#pragma once

/// @file bourne.hpp
/// @brief Main header file for the bourne library.
///
/// @code
///   bourne::Value doc = bourne::parse(R"({"name":"Fred","classes":["Algebra"]})");
///   if (const bourne::Value* name = doc.get("name")) {
///       std::string s = name->as_string();
///   }
///   doc.vivify("classes").push("History of Programming");
///   doc.vivify("rgb").insert("r", 4);
/// @endcode

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "number.hpp"
#include "value.hpp"
#include "parse_options.hpp"
#include "parser.hpp"
#include "unescape.hpp"
