#pragma once

/**
 * @file test_utils.hpp
 * @brief Common test utilities
 */

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "confflags/translator.hpp"

namespace confflags {
namespace test {

/**
 * @brief RAII helper that installs a translator for the scope of a test
 */
class ScopedTranslator {
public:
    explicit ScopedTranslator(std::shared_ptr<const Translator> translator) {
        install_translator(std::move(translator));
    }

    ~ScopedTranslator() { install_translator(nullptr); }

    ScopedTranslator(const ScopedTranslator&) = delete;
    ScopedTranslator& operator=(const ScopedTranslator&) = delete;
};

/**
 * @brief Translator that records every request and answers "[context|msgid]"
 */
class RecordingTranslator final : public Translator {
public:
    std::string translate(std::string_view msgid, std::string_view context) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.emplace_back(std::string(context), std::string(msgid));
        return "[" + std::string(context) + "|" + std::string(msgid) + "]";
    }

    [[nodiscard]] size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    [[nodiscard]] std::pair<std::string, std::string> last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.back();
    }

private:
    mutable std::mutex mutex_;
    mutable std::vector<std::pair<std::string, std::string>> requests_;
};

/**
 * @brief Catalog with German labels for a few option members
 */
inline std::shared_ptr<CatalogTranslator> make_german_catalog() {
    auto catalog = std::make_shared<CatalogTranslator>("de");
    catalog->register_entry("de", "Off", "Aus");
    catalog->register_entry("de", "Speech", "Sprache");
    catalog->register_entry("de", "Braille", "Braille");
    catalog->register_entry("de", "Speech and braille", "Sprache und Braille");
    catalog->register_entry("de", "line indentation setting", "Off", "Keine");
    catalog->register_entry("de", "line indentation setting", "Speech", "Sprachausgabe");
    catalog->register_entry("de", "remote", "Control another computer",
                            "Einen anderen Computer steuern");
    return catalog;
}

}  // namespace test
}  // namespace confflags
