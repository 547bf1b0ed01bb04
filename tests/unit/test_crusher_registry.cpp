/**
 * @file test_crusher_registry.cpp
 * @brief Unit tests for the crusher registry and the jar-backed crushers
 *
 * Tests cover:
 * - Registry query surface per content type
 * - Name resolution and unknown engines
 * - Type gating
 * - yui and closure strategies with and without java
 */

#include "../../libcrusher/include/capabilities.hpp"
#include "../../libcrusher/include/crusher_registry.hpp"
#include "../../libcrusher/include/errors.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace crusher;
using namespace crusher::test;

namespace {

CrusherConfig offline_config() {
    CrusherConfig config;
    // nothing listens on port 1
    config.closure_url = "http://127.0.0.1:1/compile";
    config.remote_timeout = std::chrono::milliseconds(2000);
    return config;
}

} // namespace

// ============================================================================
// Query surface
// ============================================================================

class CrusherRegistryTest : public ::testing::Test {
protected:
    CrusherConfig config_ = offline_config();
    Capabilities caps_{};
    CrusherRegistry registry_{caps_, config_};
};

TEST_F(CrusherRegistryTest, AvailablePerContentType) {
    EXPECT_EQ(registry_.available(ContentType::Js),
              (std::vector<std::string>{"jsmin", "jscrush", "yui", "closure"}));
    EXPECT_EQ(registry_.available(ContentType::Css),
              (std::vector<std::string>{"sqwish", "yui"}));
}

TEST_F(CrusherRegistryTest, SupportsChecksEveryName) {
    EXPECT_TRUE(registry_.supports({"jsmin", "yui"}, ContentType::Js));
    EXPECT_TRUE(registry_.supports({"sqwish", "yui"}, ContentType::Css));
    EXPECT_FALSE(registry_.supports({"jsmin", "sqwish"}, ContentType::Js));
    EXPECT_FALSE(registry_.supports({"nonexistent"}, ContentType::Css));
}

TEST_F(CrusherRegistryTest, FindByTypedId) {
    for (const auto id : {CrusherId::Jsmin, CrusherId::Jscrush, CrusherId::Sqwish,
                          CrusherId::Yui, CrusherId::Closure}) {
        const ICrusher* crusher = registry_.find(id);
        ASSERT_NE(crusher, nullptr);
        EXPECT_EQ(crusher->get_id(), id);
        EXPECT_EQ(crusher_id_from_name(crusher->get_name()), id);
    }
    EXPECT_EQ(registry_.all().size(), 5u);
}

// ============================================================================
// Resolution
// ============================================================================

TEST_F(CrusherRegistryTest, ResolveKnownName) {
    EXPECT_EQ(registry_.resolve("jsmin", "js").get_id(), CrusherId::Jsmin);
    EXPECT_EQ(registry_.resolve("sqwish", "css").get_id(), CrusherId::Sqwish);
}

TEST_F(CrusherRegistryTest, UnknownNameIsUnknownTransform) {
    try {
        (void)registry_.resolve("nonexistent", "js");
        FAIL() << "expected UnknownTransform";
    } catch (const CrushError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownTransform);
        EXPECT_STREQ(e.what(), "The engine nonexistent does not exist");
    }
}

TEST_F(CrusherRegistryTest, UnknownContentTypeIsUnknownTransform) {
    try {
        (void)registry_.resolve("jsmin", "html");
        FAIL() << "expected UnknownTransform";
    } catch (const CrushError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownTransform);
        EXPECT_STREQ(e.what(), "The engine jsmin does not exist");
    }
}

TEST_F(CrusherRegistryTest, NamesAreCaseSensitive) {
    EXPECT_THROW((void)registry_.resolve("JSMin", "js"), CrushError);
}

// ============================================================================
// Type gating
// ============================================================================

TEST_F(CrusherRegistryTest, JsOnlyCrusherRejectsCss) {
    const ICrusher& jsmin = registry_.resolve("jsmin", "css");
    EXPECT_FALSE(jsmin.accepts(ContentType::Css));

    try {
        (void)jsmin.crush(ContentType::Css, "a { color: red; }");
        FAIL() << "expected TypeMismatch";
    } catch (const CrushError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TypeMismatch);
        EXPECT_STREQ(e.what(), "Type is not supported: jsmin does not accept css");
    }
}

TEST_F(CrusherRegistryTest, CssOnlyCrusherRejectsJs) {
    const ICrusher& sqwish = registry_.resolve("sqwish", "js");
    try {
        (void)sqwish.crush(ContentType::Js, "var a = 1;");
        FAIL() << "expected TypeMismatch";
    } catch (const CrushError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TypeMismatch);
    }
}

// ============================================================================
// Jar-backed crushers
// ============================================================================

TEST_F(CrusherRegistryTest, YuiPassesContentThroughWithoutJava) {
    const ICrusher& yui = registry_.resolve("yui", "css");
    EXPECT_EQ(yui.get_strategy(), CrushStrategy::ExternalProcess);
    EXPECT_EQ(yui.crush(ContentType::Css, "a { color: red; }"), "a { color: red; }");
}

TEST_F(CrusherRegistryTest, ClosureFallsBackToRemoteServiceWithoutJava) {
    const ICrusher& closure = registry_.resolve("closure", "js");
    EXPECT_EQ(closure.get_strategy(), CrushStrategy::RemoteService);

    try {
        (void)closure.crush(ContentType::Js, "var a = 1;");
        FAIL() << "expected RemoteServiceFailed";
    } catch (const CrushError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::RemoteServiceFailed);
    }
}

class JarCrusherTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(JarCrusherTest, YuiRunsTheJarThroughJava) {
    // stand-in for java: prints its arguments after draining stdin
    Capabilities caps;
    caps.java = dir_.script("java", "cat > /dev/null; printf '%s ' \"$@\"");
    CrusherConfig config = offline_config();
    config.vendor_dir = "/opt/vendor";

    const CrusherRegistry registry(caps, config);
    const auto out = registry.resolve("yui", "js").crush(ContentType::Js, "var a = 1;");
    EXPECT_EQ(out, "-jar /opt/vendor/yui.jar --type js --line-break 256 ");
}

TEST_F(JarCrusherTest, ClosureUsesJavaWhenAvailable) {
    Capabilities caps;
    caps.java = dir_.script("java", "cat > /dev/null; printf '%s ' \"$@\"");
    CrusherConfig config = offline_config();
    config.vendor_dir = "/opt/vendor";

    const CrusherRegistry registry(caps, config);
    const ICrusher& closure = registry.resolve("closure", "js");
    EXPECT_EQ(closure.get_strategy(), CrushStrategy::ExternalProcess);
    EXPECT_EQ(closure.crush(ContentType::Js, "var a = 1;"),
              "-jar /opt/vendor/closure.jar --charset ascii --compilation_level SIMPLE_OPTIMIZATIONS "
              "--language_in ECMASCRIPT5 --warning_level QUIET --jscomp_off uselessCode ");
}

TEST_F(JarCrusherTest, FailingJavaIsReportedByExitCode) {
    Capabilities caps;
    caps.java = std::filesystem::path("/bin/false");

    const CrusherRegistry registry(caps, offline_config());
    try {
        (void)registry.resolve("yui", "css").crush(ContentType::Css, "a{}");
        FAIL() << "expected ProcessExitCode";
    } catch (const CrushError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProcessExitCode);
        EXPECT_STREQ(e.what(), "Process exited with code 1");
    }
}

// ============================================================================
// Capabilities
// ============================================================================

TEST(CapabilitiesTest, DisabledJavaIsAbsent) {
    CrusherConfig config;
    config.disable_java = true;
    config.java_path = "/bin/sh";
    EXPECT_FALSE(Capabilities::probe(config).has_java());
}

TEST(CapabilitiesTest, ExplicitPathWins) {
    CrusherConfig config;
    config.java_path = "/bin/sh";
    const auto caps = Capabilities::probe(config);
    ASSERT_TRUE(caps.has_java());
    EXPECT_EQ(*caps.java, std::filesystem::path("/bin/sh"));
}

TEST(CapabilitiesTest, NonExecutableExplicitPathIsAbsent) {
    CrusherConfig config;
    config.java_path = "/nonexistent/java";
    EXPECT_FALSE(Capabilities::probe(config).has_java());
}

TEST(CapabilitiesTest, FindExecutableSearchesPath) {
    EXPECT_TRUE(find_executable("sh").has_value());
    EXPECT_FALSE(find_executable("crusher-no-such-tool").has_value());
}
