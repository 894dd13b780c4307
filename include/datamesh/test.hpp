#pragma once
#include <vector>
#include <string>
#include <string_view>
#include <functional>
#include <source_location>
#include <format>
#include <print>
#include <chrono>
#include <cstdlib>
#include <cmath>
#include <concepts>
#include <type_traits>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cstring>
#include <atomic>
#include <filesystem>
#include <string>

namespace datamesh::test {

// ---------------------------------------------------------------------------
// Concepts
// ---------------------------------------------------------------------------

template<typename T>
concept Printable = std::formattable<T, char>;

// ---------------------------------------------------------------------------
// Colors
// ---------------------------------------------------------------------------

namespace color {
    inline constexpr const char* green  = "\033[32m";
    inline constexpr const char* red    = "\033[31m";
    inline constexpr const char* yellow = "\033[33m";
    inline constexpr const char* reset  = "\033[0m";
    inline constexpr const char* bold   = "\033[1m";
} // namespace color

// ---------------------------------------------------------------------------
// Global state
// ---------------------------------------------------------------------------

struct TestCase {
    std::string_view name;
    std::string_view file;
    int line;
    std::function<void()> func;
};

struct TestFailure {};

struct Context {
    std::atomic<int> passed{0};
    std::atomic<int> failed{0};
    std::atomic<int> checks{0};
    bool current_failed  = false;
    bool use_color       = true;
    bool verbose         = false;
    std::string filter;
};

inline std::vector<TestCase>& registry() {
    static std::vector<TestCase> r;
    return r;
}

inline Context& ctx() {
    static Context c;
    return c;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

inline const char* col(const char* code) {
    return ctx().use_color ? code : "";
}

template<typename T>
std::string to_string_val(const T& v) {
    if constexpr (Printable<T>) {
        return std::format("{}", v);
    } else {
        return "<non-printable>";
    }
}

// ---------------------------------------------------------------------------
// Assertion reporting
// ---------------------------------------------------------------------------

inline void fail_assert(const char* expr,
                        std::string_view lhs,
                        std::string_view rhs,
                        std::source_location loc) {
    ctx().current_failed = true;
    std::println(stderr, "    {}{}:{}{}: {}REQUIRE/CHECK({}) failed{}",
                 col(color::bold), loc.file_name(), col(color::reset),
                 loc.line(),
                 col(color::red), expr, col(color::reset));
    if (!lhs.empty() || !rhs.empty()) {
        std::println(stderr, "      lhs = {}", lhs);
        std::println(stderr, "      rhs = {}", rhs);
    }
}

template<typename A, typename B>
void fail_cmp(const char* expr, const A& a, const B& b,
              std::source_location loc) {
    fail_assert(expr, to_string_val(a), to_string_val(b), loc);
}

inline void pass_assert(const char* expr, std::source_location loc) {
    ctx().checks++;
    if (ctx().verbose) {
        std::println("    {}PASS{}: {} ({}:{})",
                     col(color::green), col(color::reset),
                     expr, loc.file_name(), loc.line());
    }
}

// ---------------------------------------------------------------------------
// Auto-registration
// ---------------------------------------------------------------------------

struct AutoRegister {
    AutoRegister(std::string_view name, std::function<void()> func,
                 std::source_location loc = std::source_location::current()) {
        registry().push_back({name, loc.file_name(), static_cast<int>(loc.line()), std::move(func)});
    }
};

// ---------------------------------------------------------------------------
// Scratch directories
// ---------------------------------------------------------------------------

// Fresh directory under the system temp dir, removed again on destruction.
class TempDir final {
    std::filesystem::path path_;

public:
    explicit TempDir(std::string_view suffix)
        : path_{std::filesystem::temp_directory_path() /
                std::format("datamesh_test_{}", suffix)}
    {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path operator/(std::string_view name) const
    {
        return path_ / name;
    }
};

// ---------------------------------------------------------------------------
// Runner
// ---------------------------------------------------------------------------

inline int run_all(int argc = 0, const char** argv = nullptr) {
    auto& c = ctx();
    c.passed = 0;
    c.failed = 0;
    c.checks = 0;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg.starts_with("--filter=")) {
            c.filter = std::string(arg.substr(9));
        } else if (arg == "--no-color") {
            c.use_color = false;
        } else if (arg == "--verbose") {
            c.verbose = true;
        } else if (arg == "--list") {
            for (auto& tc : registry())
                std::println("{}", tc.name);
            return 0;
        }
    }

    // Collect matching tests
    std::vector<TestCase*> to_run;
    for (auto& tc : registry()) {
        if (c.filter.empty() ||
            std::string_view(tc.name).find(c.filter) != std::string_view::npos) {
            to_run.push_back(&tc);
        }
    }

    std::println("{}[==========]{} Running {} test{}",
                 col(color::bold), col(color::reset),
                 to_run.size(), to_run.size() == 1 ? "" : "s");

    auto wall_start = std::chrono::high_resolution_clock::now();

    for (auto* tc : to_run) {
        std::println("{}[ RUN      ]{} {}", col(color::green), col(color::reset), tc->name);
        c.current_failed = false;
        auto t0 = std::chrono::high_resolution_clock::now();

        try {
            tc->func();
        } catch (const TestFailure&) {
            // Fatal assertion -- already recorded
        } catch (const std::exception& e) {
            c.current_failed = true;
            std::println(stderr, "    {}Unhandled exception{}: {}", col(color::red), col(color::reset), e.what());
        } catch (...) {
            c.current_failed = true;
            std::println(stderr, "    {}Unhandled unknown exception{}", col(color::red), col(color::reset));
        }

        auto t1 = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

        if (c.current_failed) {
            c.failed++;
            std::println("{}[  FAILED  ]{} {} ({:.1f}ms)", col(color::red), col(color::reset), tc->name, ms);
        } else {
            c.passed++;
            std::println("{}[       OK ]{} {} ({:.1f}ms)", col(color::green), col(color::reset), tc->name, ms);
        }
    }

    auto wall_end = std::chrono::high_resolution_clock::now();
    double total_ms = std::chrono::duration<double, std::milli>(wall_end - wall_start).count();

    const int p = c.passed.load();
    const int f = c.failed.load();
    std::println("{}[==========]{} {}{} passed{}, {}{} failed{} ({:.1f}ms total)",
                 col(color::bold), col(color::reset),
                 col(color::green), p, col(color::reset),
                 f ? col(color::red) : col(color::green), f, col(color::reset),
                 total_ms);

    return f > 0 ? 1 : 0;
}

} // namespace datamesh::test

// ===========================================================================
// Macros  (must be outside namespace)
// ===========================================================================

#define DATAMESH_TEST_CAT2(a, b) a##b
#define DATAMESH_TEST_CAT(a, b) DATAMESH_TEST_CAT2(a, b)

// ---------------------------------------------------------------------------
// TEST_CASE  (one per line; identifiers are keyed on __LINE__)
// ---------------------------------------------------------------------------

#define TEST_CASE(tname)                                                       \
    static void DATAMESH_TEST_CAT(datamesh_test_func_, __LINE__)();            \
    static ::datamesh::test::AutoRegister                                      \
        DATAMESH_TEST_CAT(datamesh_test_reg_, __LINE__)(                       \
            tname, DATAMESH_TEST_CAT(datamesh_test_func_, __LINE__));          \
    static void DATAMESH_TEST_CAT(datamesh_test_func_, __LINE__)()

#define SECTION(sname)                                                         \
    if (::datamesh::test::ctx().verbose)                                       \
        std::println("  {}-- {}{}",                                            \
            ::datamesh::test::col(::datamesh::test::color::yellow), sname,     \
            ::datamesh::test::col(::datamesh::test::color::reset));            \
    if (true)

// ---------------------------------------------------------------------------
// REQUIRE / CHECK  (boolean)
// ---------------------------------------------------------------------------

#define DATAMESH_BOOL_ASSERT(expr, fatal)                                      \
    do {                                                                        \
        if (!(expr)) {                                                          \
            ::datamesh::test::fail_assert(#expr, "", "",                        \
                std::source_location::current());                               \
            if constexpr (fatal) throw ::datamesh::test::TestFailure{};         \
        } else {                                                                \
            ::datamesh::test::pass_assert(#expr,                                \
                std::source_location::current());                               \
        }                                                                       \
    } while (0)

#define REQUIRE(expr) DATAMESH_BOOL_ASSERT(expr, true)
#define CHECK(expr)   DATAMESH_BOOL_ASSERT(expr, false)

// ---------------------------------------------------------------------------
// Comparison macros
// ---------------------------------------------------------------------------

#define DATAMESH_CMP_ASSERT(a, b, op, fatal)                                   \
    do {                                                                        \
        const auto& _dm_a = (a);                                                \
        const auto& _dm_b = (b);                                                \
        if (!(_dm_a op _dm_b)) {                                                \
            ::datamesh::test::fail_cmp(#a " " #op " " #b,                      \
                _dm_a, _dm_b, std::source_location::current());                 \
            if constexpr (fatal) throw ::datamesh::test::TestFailure{};         \
        } else {                                                                \
            ::datamesh::test::pass_assert(#a " " #op " " #b,                   \
                std::source_location::current());                               \
        }                                                                       \
    } while (0)

#define REQUIRE_EQ(a, b) DATAMESH_CMP_ASSERT(a, b, ==, true)
#define CHECK_EQ(a, b)   DATAMESH_CMP_ASSERT(a, b, ==, false)
#define REQUIRE_NE(a, b) DATAMESH_CMP_ASSERT(a, b, !=, true)
#define CHECK_NE(a, b)   DATAMESH_CMP_ASSERT(a, b, !=, false)
#define REQUIRE_LT(a, b) DATAMESH_CMP_ASSERT(a, b, <,  true)
#define CHECK_LT(a, b)   DATAMESH_CMP_ASSERT(a, b, <,  false)
#define REQUIRE_GT(a, b) DATAMESH_CMP_ASSERT(a, b, >,  true)
#define CHECK_GT(a, b)   DATAMESH_CMP_ASSERT(a, b, >,  false)
#define REQUIRE_LE(a, b) DATAMESH_CMP_ASSERT(a, b, <=, true)
#define CHECK_LE(a, b)   DATAMESH_CMP_ASSERT(a, b, <=, false)
#define REQUIRE_GE(a, b) DATAMESH_CMP_ASSERT(a, b, >=, true)
#define CHECK_GE(a, b)   DATAMESH_CMP_ASSERT(a, b, >=, false)

#define DATAMESH_NEAR_ASSERT(a, b, eps, fatal)                                 \
    do {                                                                        \
        const auto _dm_a = static_cast<double>(a);                              \
        const auto _dm_b = static_cast<double>(b);                              \
        const auto _dm_e = static_cast<double>(eps);                            \
        if (std::fabs(_dm_a - _dm_b) > _dm_e) {                                 \
            ::datamesh::test::fail_assert(#a " ~= " #b " (eps=" #eps ")",      \
                ::datamesh::test::to_string_val(_dm_a),                         \
                ::datamesh::test::to_string_val(_dm_b),                         \
                std::source_location::current());                               \
            if constexpr (fatal) throw ::datamesh::test::TestFailure{};         \
        } else {                                                                \
            ::datamesh::test::pass_assert(#a " ~= " #b,                        \
                std::source_location::current());                               \
        }                                                                       \
    } while (0)

#define REQUIRE_NEAR(a, b, eps) DATAMESH_NEAR_ASSERT(a, b, eps, true)
#define CHECK_NEAR(a, b, eps)   DATAMESH_NEAR_ASSERT(a, b, eps, false)

// ---------------------------------------------------------------------------
// Exceptions.  The _AS forms only accept the named type (or a subclass).
// ---------------------------------------------------------------------------

#define DATAMESH_THROWS_ASSERT(expr, catch_clause, label, fatal)               \
    do {                                                                        \
        bool _dm_threw = false;                                                 \
        try { (void)(expr); } catch_clause { _dm_threw = true; }                \
        if (!_dm_threw) {                                                       \
            ::datamesh::test::fail_assert(label, "", "",                       \
                std::source_location::current());                               \
            if constexpr (fatal) throw ::datamesh::test::TestFailure{};         \
        } else {                                                                \
            ::datamesh::test::pass_assert(label,                               \
                std::source_location::current());                               \
        }                                                                       \
    } while (0)

#define REQUIRE_THROWS(expr)                                                   \
    DATAMESH_THROWS_ASSERT(expr, catch (...), #expr " throws", true)
#define CHECK_THROWS(expr)                                                     \
    DATAMESH_THROWS_ASSERT(expr, catch (...), #expr " throws", false)
#define REQUIRE_THROWS_AS(expr, type)                                          \
    DATAMESH_THROWS_ASSERT(expr, catch (const type&),                          \
        #expr " throws " #type, true)
#define CHECK_THROWS_AS(expr, type)                                            \
    DATAMESH_THROWS_ASSERT(expr, catch (const type&),                          \
        #expr " throws " #type, false)

#define REQUIRE_NOTHROW(expr)                                                  \
    do {                                                                        \
        try { (void)(expr); }                                                   \
        catch (const std::exception& _dm_e) {                                   \
            ::datamesh::test::fail_assert(#expr " does not throw",             \
                _dm_e.what(), "", std::source_location::current());             \
            throw ::datamesh::test::TestFailure{};                              \
        }                                                                       \
        ::datamesh::test::pass_assert(#expr " does not throw",                 \
            std::source_location::current());                                   \
    } while (0)

#define DATAMESH_TEST_MAIN()                                                   \
    int main(int argc, const char** argv) {                                    \
        return ::datamesh::test::run_all(argc, argv);                          \
    }
