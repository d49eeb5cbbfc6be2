#include <algorithm>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "config/language_profile.hpp"
#include "util/errors.hpp"

using namespace sandkit;
using namespace sandkit::config;

// NOLINTNEXTLINE
TEST(language_profile, resolves_canonical_names_and_aliases) {
    EXPECT_EQ(resolve_profile("python").name, "python");
    EXPECT_EQ(resolve_profile("Python3").name, "python");
    EXPECT_EQ(resolve_profile("py").name, "python");
    EXPECT_EQ(resolve_profile("node").name, "node");
    EXPECT_EQ(resolve_profile("JavaScript").name, "node");
    EXPECT_EQ(resolve_profile("nodejs").name, "node");
}

// NOLINTNEXTLINE
TEST(language_profile, unknown_language_is_rejected) {
    try {
        resolve_profile("cobol");
        FAIL() << "expected UnsupportedLanguage";
    } catch (const UnsupportedLanguage& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UNSUPPORTED_LANGUAGE);
        EXPECT_EQ(e.language(), "cobol");
    }
    EXPECT_THROW(resolve_profile(""), UnsupportedLanguage);
    EXPECT_FALSE(is_supported_language("ruby"));
    EXPECT_TRUE(is_supported_language("PY"));
}

// NOLINTNEXTLINE
TEST(language_profile, list_languages_is_sorted_canonical_names) {
    auto names = list_languages();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "node");
    EXPECT_EQ(names[1], "python");
}

// NOLINTNEXTLINE
TEST(language_profile, python_commands) {
    const auto& py = resolve_profile("python");
    EXPECT_EQ(py.base_image, "python:3.9-slim");
    EXPECT_EQ(py.source_extension, ".py");
    EXPECT_TRUE(py.dedent_source);

    auto run = py.run_command("/workspace/.sandkit/run-1.py");
    ASSERT_EQ(run.size(), 3u);
    EXPECT_EQ(run[0], "python");
    EXPECT_EQ(run[2], "/workspace/.sandkit/run-1.py");

    auto install = py.install_command({"numpy>=1.20"});
    EXPECT_EQ(install.front(), "pip");
    EXPECT_NE(std::find(install.begin(), install.end(), "numpy>=1.20"), install.end());
    // The probe's helper package rides along exactly once
    EXPECT_EQ(std::count(install.begin(), install.end(), "packaging"), 1);
    auto with_packaging = py.install_command({"packaging"});
    EXPECT_EQ(std::count(with_packaging.begin(), with_packaging.end(), "packaging"), 1);

    auto probe = py.probe_command("requests==2.31");
    ASSERT_EQ(probe.size(), 4u);
    EXPECT_EQ(probe[1], "-c");
    EXPECT_EQ(probe.back(), "requests==2.31");
}

// NOLINTNEXTLINE
TEST(language_profile, node_commands) {
    const auto& node = resolve_profile("node");
    EXPECT_EQ(node.source_extension, ".js");
    EXPECT_FALSE(node.dedent_source);

    auto install = node.install_command({"lodash@4.17.21"});
    EXPECT_EQ(install.front(), "npm");
    EXPECT_EQ(install.back(), "lodash@4.17.21");

    auto probe = node.probe_command("lodash");
    ASSERT_EQ(probe.size(), 4u);
    EXPECT_EQ(probe[0], "node");
    EXPECT_EQ(probe[1], "-e");
}

// NOLINTNEXTLINE
TEST(language_profile, dockerfile_uses_exec_form_install) {
    const auto& py = resolve_profile("python");
    std::string df = py.dockerfile("python:3.9-slim", {"numpy", "pandas==2.0"});
    EXPECT_EQ(df.rfind("FROM python:3.9-slim\nRUN [", 0), 0u) << df;

    auto run_line = df.substr(df.find("RUN ") + 4);
    auto argv = nlohmann::json::parse(run_line);
    ASSERT_TRUE(argv.is_array());
    EXPECT_EQ(argv[0], "pip");
    EXPECT_NE(run_line.find("\"pandas==2.0\""), std::string::npos);
}
