/**
 * @file translator.cpp
 * @brief Translator slot and the catalog translator
 */

#include "confflags/translator.hpp"

#include <hyprutils/i18n/I18nEngine.hpp>

#include <mutex>
#include <shared_mutex>

#include "common/config.hpp"
#include "common/logger.hpp"

namespace confflags {

namespace {

// gettext separates msgctxt from msgid with EOT
constexpr char kContextSeparator = '\x04';

std::string message_key(std::string_view context, std::string_view msgid) {
    std::string key;
    if (!context.empty()) {
        key.reserve(context.size() + 1 + msgid.size());
        key.append(context);
        key.push_back(kContextSeparator);
    }
    key.append(msgid);
    return key;
}

std::shared_ptr<const Translator> default_translator() {
    static const std::shared_ptr<const Translator> identity =
        std::make_shared<IdentityTranslator>();
    return identity;
}

std::shared_mutex slot_mutex;
std::shared_ptr<const Translator> installed;

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// IdentityTranslator
// ─────────────────────────────────────────────────────────────────────────────

std::string IdentityTranslator::translate(std::string_view msgid,
                                          std::string_view /*context*/) const {
    return std::string(msgid);
}

// ─────────────────────────────────────────────────────────────────────────────
// CatalogTranslator
// ─────────────────────────────────────────────────────────────────────────────

CatalogTranslator::CatalogTranslator(std::string locale)
    : CatalogTranslator(std::move(locale), config::kFallbackLocale) {}

CatalogTranslator::CatalogTranslator(std::string locale, std::string fallback_locale)
    : locale_(std::move(locale)),
      fallback_locale_(std::move(fallback_locale)),
      engine_(std::make_unique<Hyprutils::I18n::CI18nEngine>()) {
    engine_->setFallbackLocale(fallback_locale_);
}

CatalogTranslator::~CatalogTranslator() = default;

void CatalogTranslator::register_entry(const std::string& locale, std::string_view msgid,
                                       std::string text) {
    register_entry(locale, std::string_view{}, msgid, std::move(text));
}

void CatalogTranslator::register_entry(const std::string& locale, std::string_view context,
                                       std::string_view msgid, std::string text) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Engine keys index a table, so they are handed out densely
    const uint64_t next = keys_.size();
    auto it = keys_.try_emplace(message_key(context, msgid), next).first;
    engine_->registerEntry(locale, it->second, std::move(text));
}

bool CatalogTranslator::has_message(std::string_view context, std::string_view msgid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.find(message_key(context, msgid)) != keys_.end();
}

void CatalogTranslator::set_locale(std::string locale) {
    std::lock_guard<std::mutex> lock(mutex_);
    locale_ = std::move(locale);
}

std::string CatalogTranslator::locale() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locale_;
}

std::string CatalogTranslator::translate(std::string_view msgid,
                                         std::string_view context) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(message_key(context, msgid));
    if (it == keys_.end()) {
        LOG_TRACE("No translation for '{}' (context '{}')", msgid, context);
        return std::string(msgid);
    }

    std::string text = engine_->localizeEntry(locale_, it->second, {});
    if (text.empty()) {
        LOG_TRACE("No {} or {} translation for '{}'", locale_, fallback_locale_, msgid);
        return std::string(msgid);
    }
    return text;
}

// ─────────────────────────────────────────────────────────────────────────────
// Translator slot
// ─────────────────────────────────────────────────────────────────────────────

void install_translator(std::shared_ptr<const Translator> translator) {
    const bool reset = translator == nullptr;
    {
        std::unique_lock lock(slot_mutex);
        installed = std::move(translator);
    }
    LOG_INFO("Translator {}", reset ? "reset to identity" : "installed");
}

std::shared_ptr<const Translator> translator() {
    std::shared_lock lock(slot_mutex);
    return installed ? installed : default_translator();
}

std::string translate(const LabelKey& key) {
    return translator()->translate(key.msgid, key.context);
}

}  // namespace confflags
