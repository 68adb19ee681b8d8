// =============================================================================
// vocabulary.hpp - Immutable Atom Tables
// =============================================================================
// Built once from a declarative source (JSON or YAML, read with yaml-cpp)
// and shared read-only by every scanner/resolver. All validation happens
// in the loader; a Vocabulary that exists is well-formed.
// =============================================================================

#pragma once

#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lambdalang/types.hpp"

namespace lambdalang {

class Vocabulary {
public:
    // Load from a .json / .yaml file. Throws IOError / ConfigurationError.
    static std::shared_ptr<const Vocabulary> load_file(const std::string& path);

    // Load from in-memory source text. Throws ConfigurationError.
    static std::shared_ptr<const Vocabulary> from_string(const std::string& text);

    const std::string& version() const noexcept { return version_; }

    // Lookup in exactly one category
    const Atom* find(Category category, std::string_view key) const;

    // Lookup across the single-character categories in precedence order
    const Atom* find_core(std::string_view key) const;

    std::optional<Category> core_category_of(std::string_view key) const;

    bool is_type_marker(std::string_view key) const {
        return find(Category::Types, key) != nullptr;
    }

    const Domain* find_domain(std::string_view code) const;

    const DisambiguationEntry* find_disambiguation(std::string_view key) const;

    // -------------------------------------------------------------------------
    // Listing
    // -------------------------------------------------------------------------

    const AtomTable& table(Category category) const {
        return tables_[static_cast<size_t>(category)];
    }

    const std::map<std::string, Domain, std::less<>>& domains() const noexcept { return domains_; }

    const std::map<std::string, DisambiguationEntry, std::less<>>& disambiguations() const noexcept {
        return disambiguation_;
    }

    size_t atom_count() const;

private:
    Vocabulary() = default;

    friend class VocabularyLoader;

    std::string version_;
    std::array<AtomTable, kCategoryCount> tables_;
    std::map<std::string, Domain, std::less<>> domains_;
    std::map<std::string, DisambiguationEntry, std::less<>> disambiguation_;
};

using VocabularyPtr = std::shared_ptr<const Vocabulary>;

} // namespace lambdalang
