#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

#include "luma/errors.hpp"

namespace luma {

using Symbol = std::uint16_t;

// Built-in node kind for unparseable input; never part of a grammar's own table.
inline constexpr Symbol kErrorSymbol = 0xFFFF;

// ABI range understood by this runtime. A grammar records the version it was built against.
inline constexpr std::uint32_t kLanguageVersion = 2;
inline constexpr std::uint32_t kMinCompatibleLanguageVersion = 1;

struct SymbolInfo {
    const char* name;
    bool named;   // appears in S-expressions / named_child()
    bool visible; // appears in the tree at all
};

class TreeBuilder;

// Grammar entry point: parse `source` and drive `builder` so that exactly one root node results.
using ParseFn = void (*)(std::string_view source, std::string_view filename, TreeBuilder& builder);

// Raw grammar handle, as exported by a compiled grammar (see luma::lang::language()).
struct LanguageDef {
    std::uint32_t version;
    const char* name;
    const SymbolInfo* symbols;
    std::uint32_t symbol_count;
    Symbol root_symbol;
    ParseFn parse;
};

// Validated view over a LanguageDef. Cheap to copy; the handle must outlive it
// (grammar handles are static, so in practice they always do).
class Language {
public:
    explicit Language(const LanguageDef* def);

    std::string_view name() const { return def_->name; }
    std::uint32_t version() const { return def_->version; }
    std::uint32_t symbol_count() const { return def_->symbol_count; }
    Symbol root_symbol() const { return def_->root_symbol; }

    std::string_view symbol_name(Symbol sym) const;
    bool symbol_is_named(Symbol sym) const;
    bool symbol_is_visible(Symbol sym) const;
    // Looks up a kind by display name; `named` distinguishes e.g. the `char` literal node from the "char" keyword.
    std::optional<Symbol> symbol_for_name(std::string_view name, bool named) const;

    const LanguageDef* def() const { return def_; }

    bool operator==(const Language& o) const { return def_ == o.def_; }
    bool operator!=(const Language& o) const { return def_ != o.def_; }

private:
    const LanguageDef* def_;
};

} // namespace luma
