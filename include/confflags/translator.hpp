#pragma once

/**
 * @file translator.hpp
 * @brief Seam to the localization system that supplies display labels
 *
 * Labels are resolved when they are requested, never when a family is
 * defined, so a translator may be installed after the option families have
 * been built.
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace Hyprutils::I18n {
class CI18nEngine;
}  // namespace Hyprutils::I18n

namespace confflags {

/**
 * @brief Untranslated message of a member's display label
 *
 * @c context disambiguates identical messages used in different settings
 * ("Off" for line indentation vs. "Off" for typing echo); it is empty when the
 * message needs none.
 */
struct LabelKey {
    std::string_view msgid;
    std::string_view context;
};

/**
 * @brief Localization collaborator
 */
class Translator {
public:
    virtual ~Translator() = default;

    /**
     * @brief Translate a message in the given context
     * @param msgid Untranslated message
     * @param context Disambiguation context, empty for none
     * @return The localized text, or @p msgid when no translation exists
     */
    [[nodiscard]] virtual std::string translate(std::string_view msgid,
                                                std::string_view context) const = 0;
};

/**
 * @brief Translator that returns every message untranslated
 *
 * Answers label requests until a real translator has been installed.
 */
class IdentityTranslator final : public Translator {
public:
    [[nodiscard]] std::string translate(std::string_view msgid,
                                        std::string_view context) const override;
};

/**
 * @brief Message catalog backed by the hyprutils i18n engine
 *
 * Messages are registered per locale. Lookup tries the active locale, then
 * the fallback locale, and finally returns the untranslated message. Every
 * operation is serialized, so one catalog may be shared between threads.
 */
class CatalogTranslator final : public Translator {
public:
    explicit CatalogTranslator(std::string locale);
    CatalogTranslator(std::string locale, std::string fallback_locale);
    ~CatalogTranslator() override;

    CatalogTranslator(const CatalogTranslator&) = delete;
    CatalogTranslator& operator=(const CatalogTranslator&) = delete;

    void register_entry(const std::string& locale, std::string_view msgid,
                        std::string text);
    void register_entry(const std::string& locale, std::string_view context,
                        std::string_view msgid, std::string text);

    /// True if any locale has a translation of @p msgid in @p context
    [[nodiscard]] bool has_message(std::string_view context, std::string_view msgid) const;

    void set_locale(std::string locale);
    [[nodiscard]] std::string locale() const;
    [[nodiscard]] const std::string& fallback_locale() const noexcept { return fallback_locale_; }

    [[nodiscard]] std::string translate(std::string_view msgid,
                                        std::string_view context) const override;

private:
    std::string locale_;
    const std::string fallback_locale_;
    std::unique_ptr<Hyprutils::I18n::CI18nEngine> engine_;
    std::unordered_map<std::string, uint64_t> keys_;  ///< context\x04msgid -> engine key
    mutable std::mutex mutex_;
};

/**
 * @brief Install the translator used for all display labels
 *
 * Passing nullptr reinstalls the identity translator.
 */
void install_translator(std::shared_ptr<const Translator> translator);

/**
 * @brief Get the currently installed translator
 */
[[nodiscard]] std::shared_ptr<const Translator> translator();

/**
 * @brief Resolve a label key through the installed translator
 */
[[nodiscard]] std::string translate(const LabelKey& key);

}  // namespace confflags
