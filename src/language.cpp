#include "luma/language.hpp"
#include <string>

namespace luma {

Language::Language(const LanguageDef* def) : def_(def) {
    if(!def) throw LanguageError("language handle is null");
    if(def->version < kMinCompatibleLanguageVersion || def->version > kLanguageVersion){
        throw LanguageError("incompatible language version " + std::to_string(def->version) +
                            " (supported: " + std::to_string(kMinCompatibleLanguageVersion) + ".." +
                            std::to_string(kLanguageVersion) + ")");
    }
    std::string label = def->name ? def->name : "<unnamed>";
    if(!def->symbols || def->symbol_count == 0) throw LanguageError("language '" + label + "' has no symbol table");
    if(def->root_symbol >= def->symbol_count) throw LanguageError("language '" + label + "' has an out-of-range root symbol");
    if(!def->parse) throw LanguageError("language '" + label + "' has no parse entry point");
}

std::string_view Language::symbol_name(Symbol sym) const {
    if(sym == kErrorSymbol) return "ERROR";
    if(sym >= def_->symbol_count) return std::string_view();
    return def_->symbols[sym].name;
}

bool Language::symbol_is_named(Symbol sym) const {
    if(sym == kErrorSymbol) return true;
    return sym < def_->symbol_count && def_->symbols[sym].named;
}

bool Language::symbol_is_visible(Symbol sym) const {
    if(sym == kErrorSymbol) return true;
    return sym < def_->symbol_count && def_->symbols[sym].visible;
}

std::optional<Symbol> Language::symbol_for_name(std::string_view name, bool named) const {
    if(named && name == "ERROR") return kErrorSymbol;
    for(std::uint32_t i = 0; i < def_->symbol_count; ++i){
        const SymbolInfo& s = def_->symbols[i];
        if(s.named == named && name == s.name) return static_cast<Symbol>(i);
    }
    return std::nullopt;
}

} // namespace luma
