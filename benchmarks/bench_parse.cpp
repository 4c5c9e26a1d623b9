/// @file bench_parse.cpp
/// @brief Performance benchmarks for the bourne parser and value tree.
///
/// Measured operations:
///   - Parsing (small, medium, large documents)
///   - Number and string heavy inputs
///   - Data access (lookup, vivify, copy)

#include <bourne/bourne.hpp>

#include <benchmark/benchmark.h>

#include <string>

using namespace bourne;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

/// Small JSON object (~60 bytes).
static std::string generate_small_json() {
    return R"({"name":"John","age":30,"active":true,"score":95.5})";
}

/// Medium JSON document (~2KB).
static std::string generate_medium_json() {
    std::string s = R"({"users": [)";
    for (int i = 0; i < 20; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"name":"user_)" + std::to_string(i) +
             R"(","email":"user)" + std::to_string(i) +
             R"(@test.com","active":)" + (i % 2 == 0 ? "true" : "false") +
             R"(,"score":)" + std::to_string(50.0 + i * 2.5) + "}";
    }
    s += R"(],"total":20,"page":1,"version":"2.0"})";
    return s;
}

/// Large JSON document (~200KB).
static std::string generate_large_json() {
    std::string s = R"({"data":[)";
    for (int i = 0; i < 1000; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"title":"Item )" + std::to_string(i) +
             R"( with a \"quoted\" title\n")" +
             R"(,"price":)" + std::to_string(9.99 + i * 0.1) +
             R"(,"quantity":)" + std::to_string(i % 100) +
             R"(,"tags":["tag)" + std::to_string(i % 10) +
             R"(","café","common"],"active":)" + (i % 3 == 0 ? "false" : "true") + "}";
    }
    s += R"(],"meta":{"total":1000,"generated":true}})";
    return s;
}

static std::string generate_int_array(int count) {
    std::string s = "[";
    for (int i = 0; i < count; ++i) {
        if (i > 0) s += ",";
        s += std::to_string(i * 7919 - 40000);
    }
    s += "]";
    return s;
}

static std::string generate_float_array(int count) {
    std::string s = "[";
    for (int i = 0; i < count; ++i) {
        if (i > 0) s += ",";
        s += std::to_string(i) + ".25e-3";
    }
    s += "]";
    return s;
}

static std::string generate_deeply_nested(int depth) {
    std::string s;
    for (int i = 0; i < depth; ++i) {
        s += R"({"level":)" + std::to_string(i) + R"(,"child":)";
    }
    s += "null";
    s += std::string(static_cast<size_t>(depth), '}');
    return s;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Parsing benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void run_parse(benchmark::State& state, const std::string& input) {
    for (auto _ : state) {
        auto v = parse(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}

static void BM_ParseSmall(benchmark::State& state) {
    run_parse(state, generate_small_json());
}
BENCHMARK(BM_ParseSmall);

static void BM_ParseMedium(benchmark::State& state) {
    run_parse(state, generate_medium_json());
}
BENCHMARK(BM_ParseMedium);

static void BM_ParseLarge(benchmark::State& state) {
    run_parse(state, generate_large_json());
}
BENCHMARK(BM_ParseLarge);

static void BM_ParseIntArray(benchmark::State& state) {
    run_parse(state, generate_int_array(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseIntArray)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_ParseFloatArray(benchmark::State& state) {
    run_parse(state, generate_float_array(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseFloatArray)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_ParseDeeplyNested(benchmark::State& state) {
    run_parse(state, generate_deeply_nested(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ParseDeeplyNested)->Arg(10)->Arg(50)->Arg(200);

static void BM_TryParseError(benchmark::State& state) {
    std::string input = generate_medium_json();
    input.back() = ',';
    for (auto _ : state) {
        auto r = try_parse(input);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_TryParseError);

// ═══════════════════════════════════════════════════════════════════════════════
// Data access benchmarks
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_LookupByKey(benchmark::State& state) {
    const auto doc = parse(generate_large_json());
    const Value* data = doc.get("data");
    for (auto _ : state) {
        int64_t sum = 0;
        for (size_t i = 0; i < data->size(); ++i) {
            if (const Value* q = data->get(i)->get("quantity")) sum += q->as_int();
        }
        benchmark::DoNotOptimize(sum);
    }
}
BENCHMARK(BM_LookupByKey);

static void BM_BuildWithVivify(benchmark::State& state) {
    for (auto _ : state) {
        Value doc;
        for (int i = 0; i < 100; ++i) {
            Value& item = doc.vivify("items").vivify(static_cast<size_t>(i));
            item.insert("id", Value(i));
            item.insert("name", Value("item_" + std::to_string(i)));
        }
        benchmark::DoNotOptimize(doc);
    }
}
BENCHMARK(BM_BuildWithVivify);

static void BM_DeepCopy(benchmark::State& state) {
    const auto doc = parse(generate_medium_json());
    for (auto _ : state) {
        Value copy = doc;
        benchmark::DoNotOptimize(copy);
    }
}
BENCHMARK(BM_DeepCopy);

static void BM_StringSize(benchmark::State& state) {
    const Value s(std::string(1000, 'a') + "\xC3\xA9\xE4\xB8\x96");
    for (auto _ : state) {
        auto n = s.size();
        benchmark::DoNotOptimize(n);
    }
}
BENCHMARK(BM_StringSize);
