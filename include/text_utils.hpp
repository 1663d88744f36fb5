#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <string>


///////////////////////////
///        TEXT         ///
///////////////////////////
/// Copy of `s` without leading and trailing blanks (space, tab, CR, LF).
std::string trim(const std::string& s);

/// ASCII lower-case copy of `s`.
std::string toLower(std::string s);

/// True if `s` is empty or holds only whitespace.
bool isBlank(const std::string& s);
