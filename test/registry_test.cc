// registry_test.cc - Unit tests for the record registry
// Tests ordering, predecessor links, duplicate and malformed record handling

#include "test_helper.h"
#include "../src/registry.h"
#include "../src/value.h"

#include <sstream>
#include <string>

using namespace ruleaudit;

static Value rules(const std::string& text) {
    Value v;
    if (!parse_rule_text(text, "test", v)) throw std::runtime_error("bad test yaml");
    return v;
}

//=============================================================================
// Composite keys
//=============================================================================

static const char* COMPOSITE_RULES =
    "- name: a\n"
    "  tag: x\n"
    "- name: b\n"
    "  tag: x\n"
    "- name: a\n"
    "  tag: x\n"
    "  match: \"second\"\n"
    "- match: \"no identity\"\n"
    "- name: c\n"
    "  tag: [z, y]\n";

TEST(registry_keeps_file_order) {
    std::ostringstream out;
    Value root = rules(COMPOSITE_RULES);
    Registry reg = build_registry(root, KeyMode::COMPOSITE, "English", out);

    ASSERT_EQ(reg.size(), 3u);
    ASSERT_EQ(reg.entries[0].key, std::string("a:x"));
    ASSERT_EQ(reg.entries[1].key, std::string("b:x"));
    ASSERT_EQ(reg.entries[2].key, std::string("c:[y, z]"));
    ASSERT_TRUE(reg.contains("c:[y, z]"));
    ASSERT_FALSE(reg.contains("c:[z, y]"));
}

TEST(registry_duplicate_reported_once_first_kept) {
    std::ostringstream out;
    Value root = rules(COMPOSITE_RULES);
    Registry reg = build_registry(root, KeyMode::COMPOSITE, "English", out);

    ASSERT_TRUE(reg.has_duplicates);
    ASSERT_EQ(test::count_of(out.str(), "Duplicate key"), 1u);
    ASSERT_CONTAINS(out.str(), "Warning: Duplicate key 'a:x' in English file.");
    ASSERT_TRUE(reg.find("a:x")->record.find("match") == nullptr);
}

TEST(registry_predecessors_skip_unregistered) {
    std::ostringstream out;
    Value root = rules(COMPOSITE_RULES);
    Registry reg = build_registry(root, KeyMode::COMPOSITE, "English", out);

    ASSERT_FALSE(reg.find("a:x")->predecessor.has_value());
    ASSERT_EQ(*reg.find("b:x")->predecessor, std::string("a:x"));
    ASSERT_EQ(*reg.find("c:[y, z]")->predecessor, std::string("b:x"));
}

TEST(registry_reports_records_without_identity) {
    std::ostringstream out;
    Value root = rules(COMPOSITE_RULES);
    Registry reg = build_registry(root, KeyMode::COMPOSITE, "translated", out);

    ASSERT_EQ(reg.skipped, 1u);
    ASSERT_CONTAINS(out.str(), "Item 4 in translated file has no name and tag");
}

TEST(registry_no_duplicates) {
    std::ostringstream out;
    Value root = rules("- name: a\n  tag: x\n- name: a\n  tag: y\n");
    Registry reg = build_registry(root, KeyMode::COMPOSITE, "English", out);

    ASSERT_FALSE(reg.has_duplicates);
    ASSERT_EQ(reg.size(), 2u);
    ASSERT_TRUE(out.str().empty());
}

TEST(registry_empty_file) {
    std::ostringstream out;
    Value root = rules("---\n# nothing here\n");
    Registry reg = build_registry(root, KeyMode::COMPOSITE, "English", out);
    ASSERT_EQ(reg.size(), 0u);
    ASSERT_FALSE(reg.has_duplicates);
}

//=============================================================================
// Single keys
//=============================================================================

TEST(registry_single_key_mode) {
    std::ostringstream out;
    Value root = rules(
        "- \"x\": [{t: \"ex\"}]\n"
        "- \"é\": [{t: \"e acute\"}]\n"
        "- {a: 1, b: 2}\n"
        "- \"x\": [{t: \"again\"}]\n");
    Registry reg = build_registry(root, KeyMode::SINGLE, "translated", out);

    ASSERT_EQ(reg.size(), 2u);
    ASSERT_EQ(reg.entries[1].key, std::string("é"));
    ASSERT_EQ(*reg.entries[1].predecessor, std::string("x"));
    ASSERT_EQ(reg.skipped, 1u);
    ASSERT_TRUE(reg.has_duplicates);
    ASSERT_CONTAINS(out.str(),
                    "Warning: Duplicate key 'x' (Unicode char: \\u0078) in translated file.");
    ASSERT_CONTAINS(out.str(), "has no single key");
}

//=============================================================================
// Main
//=============================================================================

int main() {
    std::cout << "=== Registry Unit Tests ===\n\n";

    // Tests are auto-registered by TEST macro and run during static initialization

    return test::print_summary();
}
