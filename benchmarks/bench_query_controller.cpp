// Query planning benchmarks
// Measures candidate selection and plan+drain over views with many segments

#include <benchmark/benchmark.h>
#include "query/query_controller.h"
#include "index_test_support.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sidx;

namespace {

void check(const SecondaryIndexManager::Status& st) {
    if (!st.ok)
        throw std::runtime_error(st.message);
}

// Ein Segment pro Datei, Dateien decken disjunkte Schlüsselbereiche ab
struct Fixture {
    DataStore store;
    std::unique_ptr<SecondaryIndexManager> manager;
    ColumnRef city;
    ColumnRef age;

    Fixture(int files, int rowsPerFile) {
        manager = std::make_unique<SecondaryIndexManager>(store);
        check(manager->createIndex("city", UTF8Type::instance()));
        check(manager->createIndex("age", Int64Type::instance()));

        std::vector<SegmentIndexPtr> citySegments;
        std::vector<SegmentIndexPtr> ageSegments;
        for (int f = 0; f < files; ++f) {
            Token first = static_cast<Token>(f) * rowsPerFile;
            auto file = test::makeFile(static_cast<uint64_t>(f + 1), first, first + rowsPerFile - 1);
            store.addFile(file);

            test::Entries cityRows;
            test::Entries ageRows;
            for (int r = 0; r < rowsPerFile; ++r) {
                Token t = first + r;
                cityRows.emplace_back("city-" + std::to_string((f * 7 + r) % 50), t);
                ageRows.emplace_back(Int64Type::encode(f), t);
            }
            citySegments.push_back(test::makeSegment(file, UTF8Type::instance(), cityRows));
            ageSegments.push_back(test::makeSegment(file, Int64Type::instance(), ageRows));
        }
        check(manager->attachSegments("city", {}, citySegments));
        check(manager->attachSegments("age", {}, ageSegments));

        city = *manager->column("city");
        age = *manager->column("age");
    }
};

} // namespace

static void BM_Candidates_And(benchmark::State& state) {
    Fixture fx(static_cast<int>(state.range(0)), 64);
    ExpressionGroup group{Expression::eq(fx.city, "city-7"), Expression::eq(fx.age, Int64Type::encode(3))};

    for (auto _ : state) {
        QueryController controller(*fx.manager, QueryFilter{}, std::chrono::seconds(10));
        auto candidates = controller.candidates(OperationType::AND, group);
        benchmark::DoNotOptimize(candidates);
    }
    state.SetLabel("segments=" + std::to_string(state.range(0)));
}

static void BM_PlanAndDrain_Or(benchmark::State& state) {
    Fixture fx(static_cast<int>(state.range(0)), 64);
    ExpressionGroup group{Expression::eq(fx.city, "city-7"), Expression::eq(fx.city, "city-11")};

    size_t rows = 0;
    for (auto _ : state) {
        QueryController controller(*fx.manager, QueryFilter{}, std::chrono::seconds(10));
        auto range = controller.plan(OperationType::OR, group)->build();
        while (range && range->hasNext()) {
            benchmark::DoNotOptimize(range->next());
            ++rows;
        }
        controller.finish();
    }
    state.counters["rows"] = benchmark::Counter(static_cast<double>(rows), benchmark::Counter::kIsRate);
}

BENCHMARK(BM_Candidates_And)->Arg(16)->Arg(256)->Arg(1024)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_PlanAndDrain_Or)->Arg(16)->Arg(256)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
