#pragma once
#include "luma/language.hpp"

namespace luma::lang {

// Compiled Luma grammar handle. Load it with luma::Language(language()).
const luma::LanguageDef* language();

} // namespace luma::lang
