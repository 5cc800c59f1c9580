#ifndef PIIGUARD_NER_ENTITY_RECOGNIZER_HPP
#define PIIGUARD_NER_ENTITY_RECOGNIZER_HPP

#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <algorithm>
#include <cctype>
#include <utility>
#include <sqlite3.h>
#include "../core/category.hpp"
#include "../util/logger.hpp"

/**
 * @file entity_recognizer.hpp
 * @brief Optional named-entity recognition (PERSON, ORGANIZATION, GPE, PRODUCT).
 *
 * DESIGN GOALS:
 *   - One interface, two variants resolved once at startup:
 *       GazetteerEntityRecognizer   -> capability present
 *       UnavailableEntityRecognizer -> capability absent, extract() is always empty
 *   - The gazetteer is a SQLite database with one table:
 *       CREATE TABLE entities (text TEXT NOT NULL, label TEXT NOT NULL);
 *     label is one of PERSON, ORG, GPE, PRODUCT; other labels are skipped.
 *   - Matching is case-sensitive, whole-word and leftmost-longest; spans never
 *     overlap and come back ordered by start offset.
 *   - A missing or unreadable database never raises; the host just runs
 *     pattern-only.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard::ner;
 *   auto ner = makeEntityRecognizer("gazetteer.sqlite");
 *   for (const auto &e : ner->extract("Alice Smith moved to France")) {
 *       // e.text, e.category, e.start, e.end
 *   }
 *   @endcode
 */

namespace piiguard {
namespace ner {

/**
 * @struct Entity
 * @brief A recognized span. start/end are byte offsets into the analysed text, end exclusive.
 */
struct Entity
{
    std::string text;
    core::Category category;
    size_t start;
    size_t end;
};

/**
 * @brief Label used on the wire ("ORG" for ORGANIZATION, as NER tools report it).
 */
inline std::string labelFor(core::Category c)
{
    return c == core::Category::ORGANIZATION ? "ORG" : core::toString(c);
}

/**
 * @brief Parse a gazetteer label. Returns false for labels we do not recognize.
 */
inline bool parseLabel(const std::string &label, core::Category &out)
{
    if (label == "PERSON")                           { out = core::Category::PERSON;       return true; }
    if (label == "ORG" || label == "ORGANIZATION")   { out = core::Category::ORGANIZATION; return true; }
    if (label == "GPE")                              { out = core::Category::GPE;          return true; }
    if (label == "PRODUCT")                          { out = core::Category::PRODUCT;      return true; }
    return false;
}

class EntityRecognizer
{
public:
    virtual ~EntityRecognizer() = default;

    virtual bool isAvailable() const = 0;

    virtual std::vector<Entity> extract(const std::string &text) const = 0;
};

class UnavailableEntityRecognizer : public EntityRecognizer
{
public:
    bool isAvailable() const override { return false; }

    std::vector<Entity> extract(const std::string &) const override { return {}; }
};

/**
 * @class GazetteerEntityRecognizer
 * @brief Dictionary-driven recognizer. Immutable after construction, so one
 *        instance is shared by every concurrent run.
 */
class GazetteerEntityRecognizer : public EntityRecognizer
{
public:
    struct Term
    {
        std::string text;
        core::Category category;
    };

    explicit GazetteerEntityRecognizer(std::vector<Term> terms)
    {
        for (auto &t : terms) {
            if (t.text.empty()) {
                continue;
            }
            byFirstByte_[static_cast<unsigned char>(t.text[0])].push_back(std::move(t));
            ++termCount_;
        }
        // longest first, so the first hit at a position is the leftmost-longest match
        for (auto &bucket : byFirstByte_) {
            std::stable_sort(bucket.second.begin(), bucket.second.end(),
                             [](const Term &a, const Term &b) { return a.text.size() > b.text.size(); });
        }
    }

    /**
     * @brief Load the lexicon from a SQLite gazetteer.
     * @return nullptr (with a logged warning) if the file cannot be opened or read,
     *         or holds no usable rows.
     */
    static std::unique_ptr<GazetteerEntityRecognizer> loadFromDatabase(const std::string &dbPath)
    {
        sqlite3* db = nullptr;
        if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
            util::logger::warn("[GazetteerEntityRecognizer] Could not open database: " + dbPath
                               + " (" + (db ? sqlite3_errmsg(db) : "out of memory") + ")");
            sqlite3_close(db);
            return nullptr;
        }

        sqlite3_stmt* stmt = nullptr;
        const char* sql = "SELECT text, label FROM entities";
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            util::logger::warn(std::string("[GazetteerEntityRecognizer] Unreadable gazetteer: ")
                               + sqlite3_errmsg(db));
            sqlite3_close(db);
            return nullptr;
        }

        std::vector<Term> terms;
        size_t skipped = 0;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            const unsigned char* text = sqlite3_column_text(stmt, 0);
            const unsigned char* label = sqlite3_column_text(stmt, 1);
            core::Category category;
            if (!text || !label || !parseLabel(reinterpret_cast<const char*>(label), category)) {
                ++skipped;
                continue;
            }
            std::string term(reinterpret_cast<const char*>(text));
            if (term.empty()) {
                ++skipped;
                continue;
            }
            terms.push_back(Term{std::move(term), category});
        }
        bool readOk = (rc == SQLITE_DONE);
        if (!readOk) {
            util::logger::warn(std::string("[GazetteerEntityRecognizer] Read aborted: ") + sqlite3_errmsg(db));
        }
        sqlite3_finalize(stmt);
        sqlite3_close(db);

        if (!readOk || terms.empty()) {
            util::logger::warn("[GazetteerEntityRecognizer] No usable entries in " + dbPath);
            return nullptr;
        }
        if (skipped > 0) {
            util::logger::warn("[GazetteerEntityRecognizer] Skipped " + std::to_string(skipped)
                               + " rows with empty text or unknown label");
        }
        util::logger::info("[GazetteerEntityRecognizer] Loaded " + std::to_string(terms.size())
                           + " entries from " + dbPath);
        return std::make_unique<GazetteerEntityRecognizer>(std::move(terms));
    }

    bool isAvailable() const override { return true; }

    std::vector<Entity> extract(const std::string &text) const override
    {
        std::vector<Entity> found;
        size_t i = 0;
        while (i < text.size()) {
            const Term* hit = matchAt(text, i);
            if (hit) {
                found.push_back(Entity{hit->text, hit->category, i, i + hit->text.size()});
                i += hit->text.size();
            } else {
                ++i;
            }
        }
        return found;
    }

    size_t size() const { return termCount_; }

private:
    // Bytes >= 0x80 count as word characters so we never match inside a UTF-8 word.
    static bool isWordByte(unsigned char c)
    {
        return std::isalnum(c) || c == '_' || c >= 0x80;
    }

    const Term* matchAt(const std::string &text, size_t pos) const
    {
        auto bucket = byFirstByte_.find(static_cast<unsigned char>(text[pos]));
        if (bucket == byFirstByte_.end()) {
            return nullptr;
        }
        for (const Term &t : bucket->second) {
            size_t len = t.text.size();
            if (pos + len > text.size() || text.compare(pos, len, t.text) != 0) {
                continue;
            }
            // Word boundaries only matter where the term itself starts/ends with a word byte.
            bool startsWord = isWordByte(static_cast<unsigned char>(t.text.front()));
            bool endsWord = isWordByte(static_cast<unsigned char>(t.text.back()));
            if (startsWord && pos > 0 && isWordByte(static_cast<unsigned char>(text[pos - 1]))) {
                continue;
            }
            if (endsWord && pos + len < text.size() && isWordByte(static_cast<unsigned char>(text[pos + len]))) {
                continue;
            }
            return &t;
        }
        return nullptr;
    }

    std::unordered_map<unsigned char, std::vector<Term>> byFirstByte_;
    size_t termCount_ = 0;
};

/**
 * @brief Resolve the recognizer capability once at startup.
 *        An empty path or any load failure yields the Unavailable variant.
 */
inline std::unique_ptr<EntityRecognizer> makeEntityRecognizer(const std::string &dbPath)
{
    if (dbPath.empty()) {
        util::logger::warn("[EntityRecognizer] No gazetteer configured. Pattern-based redaction only.");
        return std::make_unique<UnavailableEntityRecognizer>();
    }
    std::unique_ptr<GazetteerEntityRecognizer> gazetteer = GazetteerEntityRecognizer::loadFromDatabase(dbPath);
    if (!gazetteer) {
        util::logger::warn("[EntityRecognizer] Gazetteer unavailable. Pattern-based redaction only.");
        return std::make_unique<UnavailableEntityRecognizer>();
    }
    return std::unique_ptr<EntityRecognizer>(std::move(gazetteer));
}

} // namespace ner
} // namespace piiguard

#endif // PIIGUARD_NER_ENTITY_RECOGNIZER_HPP
