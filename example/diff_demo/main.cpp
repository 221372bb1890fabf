// main.cpp
// JSON Diff Example - Generating and applying RFC 6902 patches
//
// Usage:
//   diff_demo                      run the built-in scenarios
//   diff_demo <original> <updated> diff two JSON files
//
// Each scenario prints the patch in Full and Fast array mode, applies it
// back to the original document and checks the result.

#include <json_diff/patch_apply.h>
#include <json_diff/patch_generator.h>
#include <json_diff/serialization.h>
#include <json_diff/value_equality.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace json_diff;

namespace {

// ============================================================
// Helpers
// ============================================================

bool read_file(const char* path, std::string& out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::cerr << "cannot open " << path << "\n";
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    out = buffer.str();
    return true;
}

/// Diff, print, apply, verify. Returns false on any failure.
bool run_scenario(const std::string& title, const std::string& original_json,
                  const std::string& updated_json)
{
    std::cout << "=== " << title << " ===\n";
    std::cout << "original: " << original_json << "\n";
    std::cout << "updated:  " << updated_json << "\n";

    bool ok = true;
    for (auto mode : {ArrayDiffMode::Full, ArrayDiffMode::Fast}) {
        PatchOptions options;
        options.array_diff_mode = mode;

        PatchGenerator generator{options};
        auto patch = generator.generate_from_json(original_json, updated_json);
        if (!patch) {
            std::cerr << "  diff failed (" << to_string(patch.error_code) << "): "
                      << patch.error_message << "\n";
            return false;
        }

        std::cout << "\n[" << (mode == ArrayDiffMode::Full ? "Full" : "Fast") << "] "
                  << patch.value.size() << " operations\n";
        std::cout << to_json(patch.value) << "\n";

        auto original = from_json(original_json);
        auto updated = from_json(updated_json);
        auto applied = apply_patch(original, patch.value);
        if (!applied) {
            std::cerr << "  apply failed: " << applied.error_message << "\n";
            ok = false;
            continue;
        }

        const bool matches = values_equal(applied.value, updated);
        std::cout << "round trip: " << (matches ? "OK" : "MISMATCH") << "\n";
        ok = ok && matches;
    }
    std::cout << "\n";
    return ok;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc == 3) {
        std::string original;
        std::string updated;
        if (!read_file(argv[1], original) || !read_file(argv[2], updated)) {
            return 1;
        }
        return run_scenario(std::string(argv[1]) + " -> " + argv[2], original, updated) ? 0 : 1;
    }
    if (argc != 1) {
        std::cerr << "usage: " << argv[0] << " [<original.json> <updated.json>]\n";
        return 2;
    }

    bool ok = true;
    ok = run_scenario("Scalar member change",
                      R"({"name":"Alice","age":25})",
                      R"({"name":"Alice","age":26})") && ok;
    ok = run_scenario("Array append",
                      R"({"tags":["x","y"]})",
                      R"({"tags":["x","y","z"]})") && ok;
    ok = run_scenario("Array edit",
                      "[1,2,3]",
                      "[1,4,3,5]") && ok;
    ok = run_scenario("Element moved",
                      R"({"list":["a","b","c"]})",
                      R"({"list":["b","c","a"]})") && ok;
    ok = run_scenario("Nested document",
                      R"({"users":[{"name":"Alice","roles":["admin"]},{"name":"Bob"}],"version":1.0})",
                      R"({"users":[{"name":"Bob"},{"name":"Alice","roles":["admin","dev"]}],"version":2})") && ok;
    return ok ? 0 : 1;
}
