/**
 * @file options_test.cpp
 * @brief Property tests over every registered option family
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include "confflags/options.hpp"
#include "confflags/registry.hpp"
#include "test_utils.hpp"

namespace confflags {
namespace {

const std::vector<std::string> kExpectedFamilies = {
    "NVDAKey",
    "TypingEcho",
    "ShowMessages",
    "TetherTo",
    "BrailleMode",
    "ReportLineIndentation",
    "ReportTableHeaders",
    "ReportCellBorders",
    "AddonsAutomaticUpdate",
    "OutputMode",
    "ParagraphStartMarker",
    "ReportNotSupportedLanguage",
    "RemoteConnectionMode",
    "RemoteServerType",
};

class OptionsTest : public ::testing::Test {
protected:
    void SetUp() override { registry_ = &Registry::options(); }

    const Registry* registry_ = nullptr;
};

TEST_F(OptionsTest, AllFamiliesRegistered) {
    EXPECT_EQ(registry_->size(), kExpectedFamilies.size());
    EXPECT_EQ(registry_->get_family_names(), kExpectedFamilies);
    EXPECT_EQ(&Registry::options(), registry_);
}

TEST_F(OptionsTest, ValuesAreUnique) {
    for (const auto& name : registry_->get_family_names()) {
        const EnumerationFamily* family = registry_->get_family(name);
        ASSERT_NE(family, nullptr);

        std::set<std::string> seen;
        for (const Member* m : family->members()) {
            EXPECT_TRUE(seen.insert(m->value().to_string()).second)
                << name << "." << m->name() << " repeats a value";
            EXPECT_TRUE(m->value().fits(family->kind())) << name << "." << m->name();
        }
    }
}

TEST_F(OptionsTest, ContinuousFamiliesHaveNoGaps) {
    int continuous = 0;
    for (const auto& name : registry_->get_family_names()) {
        const EnumerationFamily* family = registry_->get_family(name);
        if (!family->is_continuous()) {
            continue;
        }
        ++continuous;

        std::vector<int64_t> ordinals;
        for (const Member* m : family->members()) {
            if (!m->is_composite()) {
                auto ordinal = m->value().ordinal();
                ASSERT_TRUE(ordinal.has_value()) << name << "." << m->name();
                ordinals.push_back(*ordinal);
            }
        }
        std::sort(ordinals.begin(), ordinals.end());
        for (size_t i = 1; i < ordinals.size(); ++i) {
            EXPECT_EQ(ordinals[i], ordinals[i - 1] + 1) << name;
        }
    }
    EXPECT_EQ(continuous, 2);
}

TEST_F(OptionsTest, EveryMemberHasLabel) {
    for (const auto& name : registry_->get_family_names()) {
        for (const Member* m : registry_->get_family(name)->members()) {
            EXPECT_FALSE(m->label().msgid.empty()) << name << "." << m->name();
            EXPECT_FALSE(m->display_label().empty()) << name << "." << m->name();
        }
    }
}

TEST_F(OptionsTest, LookupIsInverseOfValue) {
    for (const auto& name : registry_->get_family_names()) {
        const EnumerationFamily* family = registry_->get_family(name);
        for (const Member* m : family->members()) {
            const Member* found = nullptr;
            ASSERT_TRUE(registry_->lookup(name, m->value(), &found).ok())
                << name << "." << m->name();
            EXPECT_EQ(found, m);
        }
    }
}

TEST_F(OptionsTest, MembersAreRestartable) {
    for (const auto& name : registry_->get_family_names()) {
        const EnumerationFamily* family = registry_->get_family(name);
        std::vector<std::string> first;
        std::vector<std::string> second;
        for (const Member* m : family->members()) {
            first.push_back(m->name());
        }
        for (const Member* m : family->members()) {
            second.push_back(m->name());
        }
        EXPECT_EQ(first, second) << name;
        EXPECT_EQ(first.size(), family->size()) << name;
    }
}

TEST_F(OptionsTest, TypedAndRuntimeViewsAgree) {
    for (const auto& m : members<ReportTableHeaders>()) {
        const Member& runtime = registry_->member(m.id);
        EXPECT_EQ(runtime.name(), m.name);
        EXPECT_EQ(runtime.value(), StorageValue(m.value));
    }
    EXPECT_EQ(registry_->member(ParagraphStartMarker::PILCROW).value(), StorageValue("¶"));
}

TEST_F(OptionsTest, OutputModeTranslatedLabels) {
    test::ScopedTranslator scoped(test::make_german_catalog());

    EXPECT_EQ(display_label(OutputMode::SPEECH), "Sprache");
    EXPECT_EQ(display_label(OutputMode::SPEECH | OutputMode::BRAILLE), "Sprache und Braille");
    EXPECT_EQ(OutputMode::SPEECH | OutputMode::BRAILLE, OutputMode::SPEECH_AND_BRAILLE);

    // Same msgid, different context
    EXPECT_EQ(display_label(ReportLineIndentation::OFF), "Keine");
    EXPECT_EQ(display_label(ReportCellBorders::OFF), "Aus");

    const Member& leader = registry_->member(RemoteConnectionMode::LEADER);
    EXPECT_EQ(leader.display_label(), "Einen anderen Computer steuern");
}

TEST_F(OptionsTest, StoredOutputModeShowsLabel) {
    install_translator(nullptr);

    const Member* member = nullptr;
    ASSERT_TRUE(registry_->lookup("OutputMode", StorageValue(0b01), &member).ok());
    EXPECT_EQ(member, &registry_->member(OutputMode::SPEECH));
    EXPECT_EQ(member->display_label(), "Speech");
    EXPECT_EQ(registry_->family<OutputMode>().display_label(*member), "Speech");
}

TEST_F(OptionsTest, PersistedOutputModeRoundTrip) {
    const EnumerationFamily& family = registry_->family<OutputMode>();
    const StorageValue stored(storage_value(OutputMode::SPEECH_AND_BRAILLE));

    const Member* restored = nullptr;
    ASSERT_TRUE(family.lookup(stored, &restored).ok());
    EXPECT_EQ(restored, &registry_->member(OutputMode::SPEECH_AND_BRAILLE));
    EXPECT_TRUE(family.contains(stored, registry_->member(OutputMode::BRAILLE)));
}

TEST_F(OptionsTest, ConnectionModeMapping) {
    const EnumerationFamily& family = registry_->family<RemoteConnectionMode>();
    EXPECT_TRUE(family.is_continuous());
    EXPECT_EQ(family.find(StorageValue(0))->name(), "FOLLOWER");
    EXPECT_EQ(family.find(StorageValue(1))->name(), "LEADER");

    EXPECT_EQ(to_connection_mode(RemoteConnectionMode::FOLLOWER),
              remote::ConnectionMode::kFollower);
    EXPECT_EQ(remote::to_string(to_connection_mode(RemoteConnectionMode::LEADER)), "leader");
}

TEST_F(OptionsTest, ModifierKeyDecompose) {
    const EnumerationFamily& family = registry_->family<NVDAKey>();
    const StorageValue stored(storage_value(NVDAKey::CAPS_LOCK | NVDAKey::EXTENDED_INSERT));

    std::vector<const Member*> keys;
    ASSERT_TRUE(family.decompose(stored, &keys).ok());
    ASSERT_EQ(keys.size(), 2);
    EXPECT_EQ(keys[0], &registry_->member(NVDAKey::CAPS_LOCK));
    EXPECT_EQ(keys[1], &registry_->member(NVDAKey::EXTENDED_INSERT));

    // Undeclared combination: no whole-value member, but every bit is known
    EXPECT_EQ(family.find(stored), nullptr);
}

TEST_F(OptionsTest, UnknownStoredValueFallsBack) {
    const Member* found = nullptr;
    auto status = registry_->lookup("TetherTo", StorageValue("braille"), &found);
    EXPECT_TRUE(status.is_unknown_member());

    const Member& fallback = found != nullptr ? *found : registry_->member(TetherTo::AUTO);
    EXPECT_EQ(fallback.name(), "AUTO");
}

}  // namespace
}  // namespace confflags
