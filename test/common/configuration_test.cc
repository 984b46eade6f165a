#include <gtest/gtest.h>
#include "../../src/common/configuration.h"
#include "../../src/common/env_flags.h"
#include "../../src/common/errors.h"
#include "../../src/workload/workload_settings.h"

#include <cstdlib>
#include <fstream>
#include <unistd.h>

using namespace Vigil;
using namespace std::chrono_literals;

namespace {

const char* kTouchedVars[] = {
    "VIGIL_URI", "VIGIL_OPS_PER_SEC", "VIGIL_WORKERS", "VIGIL_OP_MIX",
    "VIGIL_CLUSTER_TYPE", "VIGIL_TEST_FROM_FILE", "VIGIL_TEST_QUOTED",
};

cxxopts::ParseResult Parse(std::vector<std::string> args) {
    static cxxopts::Options options = Configuration::buildCommandLineOptions();
    std::vector<char*> argv;
    static std::string program = "vigil";
    argv.push_back(program.data());
    for (auto& a : args) argv.push_back(a.data());
    int argc = static_cast<int>(argv.size());
    char** argv_ptr = argv.data();
    return options.parse(argc, argv_ptr);
}

} // namespace

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kTouchedVars) unsetenv(name);
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        for (const char* name : kTouchedVars) unsetenv(name);
        Configuration::getInstance().reset();
    }

    VigilConfig& config() { return Configuration::getInstance().config(); }
};

TEST(EnvLineTest, ParsesAssignments) {
    std::string key, value;
    ASSERT_TRUE(ParseEnvLine("VIGIL_URI=memory://local", key, value));
    EXPECT_EQ(key, "VIGIL_URI");
    EXPECT_EQ(value, "memory://local");

    ASSERT_TRUE(ParseEnvLine("  export VIGIL_DB = \"liveness db\"  ", key, value));
    EXPECT_EQ(key, "VIGIL_DB");
    EXPECT_EQ(value, "liveness db");

    ASSERT_TRUE(ParseEnvLine("VIGIL_OP_MIX='find=1'", key, value));
    EXPECT_EQ(value, "find=1");

    ASSERT_TRUE(ParseEnvLine("EMPTY=", key, value));
    EXPECT_EQ(value, "");
}

TEST(EnvLineTest, SkipsCommentsAndGarbage) {
    std::string key, value;
    EXPECT_FALSE(ParseEnvLine("", key, value));
    EXPECT_FALSE(ParseEnvLine("   ", key, value));
    EXPECT_FALSE(ParseEnvLine("# VIGIL_URI=x", key, value));
    EXPECT_FALSE(ParseEnvLine("no equals sign", key, value));
    EXPECT_FALSE(ParseEnvLine("=value", key, value));
}

TEST_F(ConfigurationTest, EnvFileDoesNotOverrideEnvironment) {
    char path[] = "/tmp/vigil_env_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "VIGIL_TEST_FROM_FILE=file\n"
            << "export VIGIL_TEST_QUOTED=\"quoted value\"\n"
            << "VIGIL_URI=memory://from-file\n";
    }
    setenv("VIGIL_URI", "memory://from-env", 1);

    EXPECT_EQ(LoadEnvFile(path), 2);
    EXPECT_STREQ(std::getenv("VIGIL_TEST_FROM_FILE"), "file");
    EXPECT_STREQ(std::getenv("VIGIL_TEST_QUOTED"), "quoted value");
    EXPECT_STREQ(std::getenv("VIGIL_URI"), "memory://from-env");
    unlink(path);
}

TEST_F(ConfigurationTest, MissingEnvFileLoadsNothing) {
    EXPECT_EQ(LoadEnvFile("/nonexistent/vigil/.env"), 0);
}

TEST_F(ConfigurationTest, DefaultsMatchDocumentedValues) {
    const VigilConfig& c = config();
    EXPECT_EQ(c.storage.uri.get(), "");
    EXPECT_EQ(c.storage.db.get(), "liveness");
    EXPECT_EQ(c.storage.collection.get(), "probe");
    EXPECT_EQ(c.storage.max_pool_size.get(), 50);
    EXPECT_EQ(c.workload.total_docs.get(), 1000u);
    EXPECT_DOUBLE_EQ(c.workload.ops_per_sec.get(), 50.0);
    EXPECT_EQ(c.workload.workers.get(), 4);
    EXPECT_EQ(c.workload.op_mix.get(), "find=70,insert=20,update=10");
    EXPECT_EQ(c.workload.cluster_type.get(), "replica_set");
}

TEST_F(ConfigurationTest, LoadsYaml) {
    ASSERT_TRUE(Configuration::getInstance().loadFromString(R"(
vigil:
  storage:
    uri: memory://yaml
    db: app
  workload:
    ops_per_sec: 250
    workers: 8
    cluster_type: geosharded
    op_mix: {find: 50, insert: 50}
    zones: [US, DE]
  heartbeat:
    failure_threshold: 5
)"));
    EXPECT_EQ(config().storage.uri.get(), "memory://yaml");
    EXPECT_EQ(config().storage.db.get(), "app");
    EXPECT_DOUBLE_EQ(config().workload.ops_per_sec.get(), 250.0);
    EXPECT_EQ(config().workload.workers.get(), 8);
    EXPECT_EQ(config().workload.cluster_type.get(), "geosharded");
    EXPECT_EQ(config().workload.op_mix.get(), "find=50,insert=50");
    EXPECT_EQ(config().workload.zones.get(), "US,DE");
    EXPECT_EQ(config().heartbeat.failure_threshold.get(), 5);
}

TEST_F(ConfigurationTest, MalformedYamlIsRejected) {
    EXPECT_FALSE(Configuration::getInstance().loadFromString("vigil: [unclosed"));
}

TEST_F(ConfigurationTest, EnvironmentBeatsFileAndCommandLineBeatsEnvironment) {
    ASSERT_TRUE(Configuration::getInstance().loadFromString("vigil:\n  workload:\n    workers: 8\n"));
    EXPECT_EQ(config().workload.workers.get(), 8);

    setenv("VIGIL_WORKERS", "12", 1);
    EXPECT_EQ(config().workload.workers.get(), 12);

    ASSERT_TRUE(Configuration::getInstance().overrideFromCommandLine(Parse({"--workers", "3"})));
    EXPECT_EQ(config().workload.workers.get(), 3);
}

TEST_F(ConfigurationTest, UnparsableEnvironmentFallsBack) {
    setenv("VIGIL_OPS_PER_SEC", "fast", 1);
    EXPECT_DOUBLE_EQ(config().workload.ops_per_sec.get(), 50.0);
}

TEST_F(ConfigurationTest, CommandLineFlags) {
    ASSERT_TRUE(Configuration::getInstance().overrideFromCommandLine(Parse({
        "--uri", "memory://cli", "--ops_per_sec", "120", "--op_mix", "find=1",
        "--cluster_type", "sharded", "--coll", "events"})));
    EXPECT_EQ(config().storage.uri.get(), "memory://cli");
    EXPECT_EQ(config().storage.collection.get(), "events");
    EXPECT_DOUBLE_EQ(config().workload.ops_per_sec.get(), 120.0);
    EXPECT_EQ(config().workload.op_mix.get(), "find=1");
    EXPECT_EQ(config().workload.cluster_type.get(), "sharded");
}

TEST_F(ConfigurationTest, MissingUriFailsValidation) {
    EXPECT_FALSE(Configuration::getInstance().validate());
    auto errors = Configuration::getInstance().getValidationErrors();
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors.front(), "--uri or VIGIL_URI must be provided");

    setenv("VIGIL_URI", "memory://ok", 1);
    EXPECT_TRUE(Configuration::getInstance().validate());
}

TEST_F(ConfigurationTest, ValidationCollectsEveryProblem) {
    config().storage.uri.set("memory://ok");
    config().workload.ops_per_sec.set(0.0);
    config().workload.workers.set(0);
    config().workload.cluster_type.set("mesh");
    EXPECT_FALSE(Configuration::getInstance().validate());
    EXPECT_EQ(Configuration::getInstance().getValidationErrors().size(), 3u);
}

TEST_F(ConfigurationTest, BuildsTypedSettings) {
    config().storage.uri.set("memory://ok");
    config().workload.cluster_type.set("geosharded");
    config().workload.zones.set("US, DE ,JP");
    config().workload.op_mix.set("find=2,update=2");

    WorkloadSettings s = BuildWorkloadSettings(config());
    EXPECT_EQ(s.store.uri, "memory://ok");
    EXPECT_EQ(s.topology, ClusterTopology::GEOSHARDED);
    EXPECT_EQ(s.store.topology, ClusterTopology::GEOSHARDED);
    EXPECT_EQ(s.zones, (ZoneSet{"US", "DE", "JP"}));
    EXPECT_DOUBLE_EQ(s.mix.weight(OperationKind::INSERT), 0.0);
    EXPECT_EQ(s.acquire_timeout, 1000ms);
    EXPECT_EQ(s.shutdown_grace, 5000ms);
    EXPECT_EQ(s.heartbeat.failure_threshold, 3);
}

TEST_F(ConfigurationTest, SettingsRejectInvalidValues) {
    EXPECT_THROW(BuildWorkloadSettings(config()), ConfigurationError);

    config().storage.uri.set("memory://ok");
    config().workload.op_mix.set("find=0,insert=0,update=0");
    EXPECT_THROW(BuildWorkloadSettings(config()), ConfigurationError);

    config().workload.op_mix.set("find=1");
    config().workload.ops_per_sec.set(-1.0);
    EXPECT_THROW(BuildWorkloadSettings(config()), ConfigurationError);

    config().workload.ops_per_sec.set(10.0);
    config().workload.cluster_type.set("mesh");
    EXPECT_THROW(BuildWorkloadSettings(config()), ConfigurationError);
}
