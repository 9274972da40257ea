/**
 * @file basic_usage.cpp
 * @brief Basic usage example for confflags
 */

#include <iostream>
#include <memory>

#include <confflags/confflags.hpp>

namespace {

// Value as it would come back from a settings file written by a newer version
confflags::StorageValue read_stored_tether() {
    return confflags::StorageValue("braille");
}

}  // namespace

int main() {
    std::cout << "confflags v" << confflags::version() << "\n\n";

    try {
        const auto& registry = confflags::Registry::options();

        // Populate choice lists the way a settings dialog would
        auto catalog = std::make_shared<confflags::CatalogTranslator>("de");
        catalog->register_entry("de", "Off", "Aus");
        catalog->register_entry("de", "Speech", "Sprache");
        catalog->register_entry("de", "Speech and braille", "Sprache und Braille");
        confflags::install_translator(catalog);

        for (const auto& name : registry.get_family_names()) {
            const confflags::EnumerationFamily* family = registry.get_family(name);
            std::cout << name << " (" << confflags::to_string(family->kind()) << ")\n";
            for (const confflags::Member* member : family->members()) {
                std::cout << "  " << member->value().to_string() << "  "
                          << member->display_label() << "\n";
            }
        }

        // Persist a typed choice and restore it
        std::cout << "\nPersistence:\n";
        const confflags::StorageValue stored(
            confflags::storage_value(confflags::OutputMode::SPEECH_AND_BRAILLE));
        confflags::OutputMode mode{};
        auto status = confflags::lookup(stored.as_integer(), &mode);
        if (!status.ok()) {
            std::cerr << "Error: " << status.to_string() << std::endl;
            return 1;
        }
        std::cout << "  OutputMode " << stored.to_string() << " -> "
                  << confflags::member_name(mode) << "\n";

        // Unknown values fall back to a default instead of failing
        const confflags::Member* tether = nullptr;
        status = registry.lookup("TetherTo", read_stored_tether(), &tether);
        if (status.is_unknown_member()) {
            std::cout << "  " << status.to_string() << ", using default\n";
            tether = &registry.member(confflags::TetherTo::AUTO);
        }
        std::cout << "  TetherTo -> " << tether->name() << "\n";

        confflags::install_translator(nullptr);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
