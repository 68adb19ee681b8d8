#include "lambdalang/vocabulary.hpp"
#include "lambdalang/error.hpp"
#include "lambdalang/logging.hpp"
#include "lambdalang/util/utf8.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>

namespace lambdalang {

// =============================================================================
// Key shape checks
// =============================================================================

namespace {

bool is_reserved(uint32_t cp) {
    return util::is_space(cp) || cp == '{' || cp == '}' || cp == 0xFFFD;
}

bool is_bracket(uint32_t cp) {
    return cp == '(' || cp == ')' || cp == '[' || cp == ']';
}

// The scanner matches brackets before any atom, so a key may not start
// with one; later positions are free (":)" is a valid emotion key).
bool is_symbol_key(const std::string& key, size_t min_chars, size_t max_chars) {
    auto chars = util::split_utf8(key);
    if (chars.size() < min_chars || chars.size() > max_chars) return false;
    if (is_bracket(chars.front().codepoint)) return false;
    for (const auto& c : chars) {
        if (is_reserved(c.codepoint)) return false;
    }
    return true;
}

bool is_lower_word(const std::string& key, size_t min_len, size_t max_len) {
    if (key.size() < min_len || key.size() > max_len) return false;
    for (char c : key) {
        if (!util::is_ascii_lower(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string describe_mark(const YAML::Node& node) {
    if (!node.IsDefined()) return "";
    const YAML::Mark mark = node.Mark();
    if (mark.is_null()) return "";
    return " (line " + std::to_string(mark.line + 1) + ", column " + std::to_string(mark.column + 1) + ")";
}

} // namespace

// =============================================================================
// VocabularyLoader - validates and builds a Vocabulary from a YAML/JSON tree
// =============================================================================

class VocabularyLoader {
public:
    explicit VocabularyLoader(std::string origin) : origin_(std::move(origin)) {}

    std::shared_ptr<const Vocabulary> load(const YAML::Node& root) {
        std::shared_ptr<Vocabulary> vocab(new Vocabulary());

        require(root.IsMap(), "vocabulary source must be a mapping", root);

        const YAML::Node version = root["version"];
        require(version.IsDefined() && version.IsScalar(), "missing required field 'version'", root);
        vocab->version_ = version.as<std::string>();

        for (Category category : kCoreCategories) {
            load_category(*vocab, root, category, category == Category::Types);
        }
        load_category(*vocab, root, Category::Extended, true);
        load_category(*vocab, root, Category::Discourse, false);
        load_category(*vocab, root, Category::Emotion, false);

        load_domains(*vocab, root);
        load_disambiguation(*vocab, root);

        LOG_INFO("Loaded vocabulary ", vocab->version_, " from ", origin_, ": ",
                 vocab->atom_count(), " atoms, ", vocab->domains_.size(), " domains, ",
                 vocab->disambiguation_.size(), " disambiguation entries");
        return vocab;
    }

private:
    [[noreturn]] void fail(const std::string& message, const YAML::Node& node) const {
        throw ConfigurationError(message + describe_mark(node), origin_,
                                 "check the vocabulary source against data/atoms.json");
    }

    void require(bool condition, const std::string& message, const YAML::Node& node) const {
        if (!condition) fail(message, node);
    }

    static std::string scalar_key(const YAML::Node& key) {
        return key.IsScalar() ? key.as<std::string>() : std::string();
    }

    Gloss read_gloss(const YAML::Node& node, const std::string& where) const {
        require(node.IsDefined() && node.IsMap(), where + ": entry must be a mapping with 'en' and 'zh'", node);

        const YAML::Node en = node["en"];
        const YAML::Node zh = node["zh"];
        require(en.IsDefined() && en.IsScalar(), where + ": missing 'en' rendering", node);
        require(zh.IsDefined() && zh.IsScalar(), where + ": missing 'zh' rendering", node);

        return Gloss{en.as<std::string>(), zh.as<std::string>()};
    }

    bool valid_key(Category category, const std::string& key) const {
        switch (category) {
            case Category::Extended:
                return is_lower_word(key, 2, 2);
            case Category::Discourse:
            case Category::Emotion:
                return is_symbol_key(key, 2, 2);
            default:
                return is_symbol_key(key, 1, 1);
        }
    }

    void load_category(Vocabulary& vocab, const YAML::Node& root, Category category, bool required) const {
        const std::string section = category_name(category);
        const YAML::Node node = root[section];

        if (!node.IsDefined() || node.IsNull()) {
            require(!required, "missing required section '" + section + "'", root);
            return;
        }
        require(node.IsMap(), "section '" + section + "' must be a mapping", node);

        AtomTable& table = vocab.tables_[static_cast<size_t>(category)];
        for (const auto& kv : node) {
            const std::string key = scalar_key(kv.first);
            const std::string where = section + "." + key;

            require(valid_key(category, key), "invalid key '" + key + "' in section '" + section + "'", kv.first);

            Atom atom{key, read_gloss(kv.second, where), category};
            bool inserted = table.emplace(key, std::move(atom)).second;
            require(inserted, "duplicate key '" + key + "' in section '" + section + "'", kv.first);
        }
    }

    void load_domains(Vocabulary& vocab, const YAML::Node& root) const {
        const YAML::Node node = root["domains"];
        if (!node.IsDefined() || node.IsNull()) return;
        require(node.IsMap(), "section 'domains' must be a mapping", node);

        for (const auto& kv : node) {
            const std::string code = scalar_key(kv.first);
            const std::string where = "domains." + code;
            require(is_lower_word(code, 2, 3), "domain code '" + code + "' must be 2-3 lowercase letters", kv.first);
            require(kv.second.IsMap(), where + " must be a mapping", kv.second);

            Domain domain;
            domain.code = code;
            domain.name = read_gloss(kv.second["name"], where + ".name");

            const YAML::Node atoms = kv.second["atoms"];
            require(atoms.IsDefined() && atoms.IsMap(), where + ": missing 'atoms' mapping", kv.second);

            for (const auto& entry : atoms) {
                const std::string key = scalar_key(entry.first);
                require(is_symbol_key(key, 1, 3) && key.find(':') == std::string::npos,
                        "invalid atom key '" + key + "' in " + where, entry.first);
                bool inserted = domain.atoms.emplace(key, read_gloss(entry.second, where + "." + key)).second;
                require(inserted, "duplicate atom '" + key + "' in " + where, entry.first);
            }

            bool inserted = vocab.domains_.emplace(code, std::move(domain)).second;
            require(inserted, "duplicate domain '" + code + "'", kv.first);
        }
    }

    // Every disambiguation key must already be an extended atom; its primary
    // rendering defaults to that entry when the source omits one.
    void load_disambiguation(Vocabulary& vocab, const YAML::Node& root) const {
        const YAML::Node node = root["disambiguation"];
        if (!node.IsDefined() || node.IsNull()) return;
        require(node.IsMap(), "section 'disambiguation' must be a mapping", node);

        const AtomTable& extended = vocab.tables_[static_cast<size_t>(Category::Extended)];

        for (const auto& kv : node) {
            const std::string key = scalar_key(kv.first);
            const std::string where = "disambiguation." + key;

            auto base = extended.find(key);
            require(base != extended.end(),
                    "disambiguation key '" + key + "' has no primary entry in 'extended'", kv.first);
            require(kv.second.IsMap(), where + " must be a mapping", kv.second);

            DisambiguationEntry entry;
            entry.key = key;
            entry.primary = base->second.gloss;

            for (const auto& alt : kv.second) {
                const std::string marker = scalar_key(alt.first);
                if (marker == "primary") {
                    entry.primary = read_gloss(alt.second, where + ".primary");
                    continue;
                }
                require(marker.size() == 1 && is_marker(marker[0]),
                        "unknown disambiguation marker '" + marker + "' in " + where, alt.first);
                bool inserted = entry.alternates.emplace(marker[0], read_gloss(alt.second, where + "." + marker)).second;
                require(inserted, "duplicate marker '" + marker + "' in " + where, alt.first);
            }

            if (entry.primary.en != base->second.gloss.en) {
                LOG_WARNING("Disambiguation primary for '", key, "' (", entry.primary.en,
                            ") differs from extended entry (", base->second.gloss.en, ")");
            }

            vocab.disambiguation_.emplace(key, std::move(entry));
        }
    }

    std::string origin_;
};

// =============================================================================
// Vocabulary
// =============================================================================

std::shared_ptr<const Vocabulary> Vocabulary::load_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw IOError("Vocabulary file not found: " + path, "Vocabulary::load_file",
                      "set LAMBDALANG_VOCAB or pass --vocab <file>");
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile& e) {
        throw IOError("Could not open vocabulary file: " + path, e.what());
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Malformed vocabulary source: " + std::string(e.what()), path);
    }
    return VocabularyLoader(path).load(root);
}

std::shared_ptr<const Vocabulary> Vocabulary::from_string(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Malformed vocabulary source: " + std::string(e.what()), "<string>");
    }
    return VocabularyLoader("<string>").load(root);
}

const Atom* Vocabulary::find(Category category, std::string_view key) const {
    const AtomTable& t = tables_[static_cast<size_t>(category)];
    auto it = t.find(key);
    return it != t.end() ? &it->second : nullptr;
}

const Atom* Vocabulary::find_core(std::string_view key) const {
    for (Category category : kCoreCategories) {
        if (const Atom* atom = find(category, key)) return atom;
    }
    return nullptr;
}

std::optional<Category> Vocabulary::core_category_of(std::string_view key) const {
    const Atom* atom = find_core(key);
    if (!atom) return std::nullopt;
    return atom->category;
}

const Domain* Vocabulary::find_domain(std::string_view code) const {
    auto it = domains_.find(code);
    return it != domains_.end() ? &it->second : nullptr;
}

const DisambiguationEntry* Vocabulary::find_disambiguation(std::string_view key) const {
    auto it = disambiguation_.find(key);
    return it != disambiguation_.end() ? &it->second : nullptr;
}

size_t Vocabulary::atom_count() const {
    size_t total = 0;
    for (const auto& t : tables_) total += t.size();
    return total;
}

} // namespace lambdalang
