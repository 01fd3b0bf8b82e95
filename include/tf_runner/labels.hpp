// tf_runner/labels.hpp
// Class-name table parsed from a JSON label asset
//
// Payload: { "classes": ["cat", "dog", ...] }
// Index i names score i of the classifier output.

#pragma once

#include <cctype>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "tf_runner/detail/file_io.hpp"
#include "tf_runner/error.hpp"
#include "tf_runner/format.hpp"
#include "tf_runner/logging.hpp"

namespace tf_runner {

inline constexpr const char* kLabelClassesKey = "classes";

class LabelTable {
public:
    LabelTable() = default;

    explicit LabelTable(std::vector<std::string> names) : names_(std::move(names)) {}

    /// Strict parse. Throws InvalidLabelData on empty text, malformed JSON,
    /// a non-object document or a "classes" value that is not an array of
    /// strings. A document without "classes" yields an empty table.
    [[nodiscard]] static LabelTable Parse(std::string_view text) {
        if (is_blank_(text)) {
            throw Error::InvalidLabelData("LabelTable::Parse", "label payload is empty");
        }

        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(text.begin(), text.end());
        } catch (const nlohmann::json::parse_error& e) {
            throw Error::InvalidLabelData("LabelTable::Parse",
                detail::format("malformed JSON: {}", e.what()));
        }

        if (!doc.is_object()) {
            throw Error::InvalidLabelData("LabelTable::Parse",
                detail::format("expected a JSON object, got {}", doc.type_name()));
        }

        auto it = doc.find(kLabelClassesKey);
        if (it == doc.end()) {
            logger()->warn("label payload has no \"{}\" key; label table is empty",
                kLabelClassesKey);
            return LabelTable{};
        }
        if (!it->is_array()) {
            throw Error::InvalidLabelData("LabelTable::Parse",
                detail::format("\"{}\" must be an array, got {}", kLabelClassesKey, it->type_name()));
        }

        std::vector<std::string> names;
        names.reserve(it->size());
        for (std::size_t i = 0; i < it->size(); ++i) {
            const auto& entry = (*it)[i];
            if (!entry.is_string()) {
                throw Error::InvalidLabelData("LabelTable::Parse",
                    detail::format("\"{}\"[{}] must be a string, got {}",
                        kLabelClassesKey, i, entry.type_name()));
            }
            names.push_back(entry.get<std::string>());
        }
        return LabelTable(std::move(names));
    }

    /// Lenient load used at startup: a missing or malformed payload is
    /// logged and leaves the table empty. Returns true on success.
    bool load(std::optional<std::string_view> text) {
        names_.clear();
        if (!text) {
            logger()->error("no label payload supplied; class count is 0");
            return false;
        }
        try {
            *this = Parse(*text);
        } catch (const Error& e) {
            logger()->error("failed to load labels: {}", e.what());
            return false;
        }
        logger()->info("loaded {} class labels", names_.size());
        return true;
    }

    /// load() from a file; an unreadable file is logged like bad content.
    bool load_file(const std::filesystem::path& path) {
        std::string text;
        try {
            text = detail::read_file_text(path, "LabelTable::load_file");
        } catch (const Error& e) {
            names_.clear();
            logger()->error("failed to read labels: {}", e.what());
            return false;
        }
        return load(std::string_view(text));
    }

    /// Name of class `index`; IndexOutOfRange outside [0, size()).
    [[nodiscard]] const std::string& class_name(int index) const {
        if (index < 0 || static_cast<std::size_t>(index) >= names_.size()) {
            throw Error::IndexOutOfRange("LabelTable::class_name", index, names_.size());
        }
        return names_[static_cast<std::size_t>(index)];
    }

    [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }
    [[nodiscard]] bool empty() const noexcept { return names_.empty(); }
    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }

private:
    std::vector<std::string> names_;

    static bool is_blank_(std::string_view text) noexcept {
        for (unsigned char c : text) {
            if (!std::isspace(c)) return false;
        }
        return true;
    }
};

} // namespace tf_runner
