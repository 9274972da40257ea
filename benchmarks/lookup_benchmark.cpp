/**
 * @file lookup_benchmark.cpp
 * @brief Benchmarks for member lookup and label resolution
 */

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <confflags/confflags.hpp>

namespace {

void SkipWithStatus(benchmark::State &state, const confflags::Status &status) {
    const std::string message = status.to_string();
    state.SkipWithError(message.c_str());
}

static void BM_TypedLookup(benchmark::State &state) {
    int64_t stored = 0;
    for (auto _ : state) {
        confflags::ReportTableHeaders headers{};
        auto status = confflags::lookup(stored, &headers);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        benchmark::DoNotOptimize(headers);
        stored = (stored + 1) % 4;
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TypedLookup);

static void BM_RuntimeIntegerLookup(benchmark::State &state) {
    const auto &family = confflags::Registry::options().family<confflags::OutputMode>();
    const confflags::StorageValue stored(int64_t{3});

    for (auto _ : state) {
        const confflags::Member *member = nullptr;
        auto status = family.lookup(stored, &member);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        benchmark::DoNotOptimize(member);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_RuntimeIntegerLookup);

static void BM_RuntimeStringLookup(benchmark::State &state) {
    const auto &registry = confflags::Registry::options();
    const confflags::StorageValue stored("disabled");

    for (auto _ : state) {
        const confflags::Member *member = nullptr;
        auto status = registry.lookup("AddonsAutomaticUpdate", stored, &member);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        benchmark::DoNotOptimize(member);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_RuntimeStringLookup);

static void BM_Decompose(benchmark::State &state) {
    const auto &family = confflags::Registry::options().family<confflags::NVDAKey>();
    const confflags::StorageValue stored(int64_t{7});
    std::vector<const confflags::Member *> keys;

    for (auto _ : state) {
        auto status = family.decompose(stored, &keys);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        benchmark::DoNotOptimize(keys.data());
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Decompose);

static void BM_DisplayLabel(benchmark::State &state) {
    auto catalog = std::make_shared<confflags::CatalogTranslator>("de");
    catalog->register_entry("de", "line indentation setting", "Tones", "Töne");
    confflags::install_translator(catalog);

    for (auto _ : state) {
        std::string label = confflags::display_label(confflags::ReportLineIndentation::TONES);
        benchmark::DoNotOptimize(label.data());
    }
    state.SetItemsProcessed(state.iterations());

    confflags::install_translator(nullptr);
}

BENCHMARK(BM_DisplayLabel);

}  // namespace
