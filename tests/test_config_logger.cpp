#include <gtest/gtest.h>
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include "infrastructure/error_handling.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cmath>

using namespace qkdsim;
using namespace qkdsim::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::enableConsole(false);
        Config::instance().onChange(nullptr);
        Config::instance().reset();
        testDir = std::filesystem::temp_directory_path() / "qkdsim_config_test";
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        Config::instance().onChange(nullptr);
        Config::instance().reset();
        std::filesystem::remove_all(testDir);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        std::filesystem::path p = testDir / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }

    std::filesystem::path testDir;
};

TEST_F(ConfigTest, DefaultsDescribeIdealBB84Run) {
    auto cfg = Config::instance().getSimulationConfig();
    EXPECT_EQ(cfg.protocol, quantum::Protocol::BB84);
    EXPECT_EQ(cfg.qubitCount, quantum::DEFAULT_QUBIT_COUNT);
    EXPECT_DOUBLE_EQ(cfg.eavesdropProbability, 0.0);
    EXPECT_DOUBLE_EQ(cfg.disclosedSampleFraction, quantum::DEFAULT_SAMPLE_FRACTION);
    EXPECT_DOUBLE_EQ(cfg.qberThreshold, quantum::DEFAULT_QBER_THRESHOLD);
    EXPECT_FALSE(cfg.seed.has_value());
    EXPECT_TRUE(cfg.customBits.empty());
    EXPECT_EQ(cfg.teleportationBasis, quantum::Basis::RECTILINEAR);

    LogConfig log = Config::instance().getLogConfig();
    EXPECT_EQ(log.level, "warn");
    EXPECT_TRUE(log.console);
    EXPECT_FALSE(cfg.includeTranscript);
}

TEST_F(ConfigTest, LoadParsesKeyValueFile) {
    std::string path = writeFile("sim.conf",
        "# experiment\n"
        "simulation.protocol = e91\n"
        "simulation.qubit_count=5000\n"
        "simulation.eavesdrop_probability = 0.25\n"
        "simulation.seed = 42\n"
        "simulation.teleportation_basis = diagonal\n"
        "this line is ignored\n"
        "\n"
        "report.include_transcript = yes\n");
    ASSERT_TRUE(Config::instance().load(path));
    EXPECT_EQ(Config::instance().getConfigPath(), path);

    auto cfg = Config::instance().getSimulationConfig();
    EXPECT_EQ(cfg.protocol, quantum::Protocol::E91);
    EXPECT_EQ(cfg.qubitCount, 5000);
    EXPECT_DOUBLE_EQ(cfg.eavesdropProbability, 0.25);
    ASSERT_TRUE(cfg.seed.has_value());
    EXPECT_EQ(*cfg.seed, 42u);
    EXPECT_EQ(cfg.teleportationBasis, quantum::Basis::DIAGONAL);
    EXPECT_TRUE(cfg.includeTranscript);
    EXPECT_FALSE(Config::instance().has("this line is ignored"));
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(Config::instance().load((testDir / "absent.conf").string()));
}

TEST_F(ConfigTest, MalformedValuesFallBack) {
    Config& c = Config::instance();
    c.set("simulation.qubit_count", "12abc");
    c.set("simulation.channel_noise_probability", "lots");
    c.set("simulation.seed", "-x");
    c.set("simulation.protocol", "b92");
    auto cfg = c.getSimulationConfig();
    EXPECT_EQ(cfg.qubitCount, quantum::DEFAULT_QUBIT_COUNT);
    EXPECT_DOUBLE_EQ(cfg.channelNoiseProbability, 0.0);
    EXPECT_FALSE(cfg.seed.has_value());
    EXPECT_EQ(cfg.protocol, quantum::Protocol::BB84);
    EXPECT_TRUE(c.getBool("missing.flag", true));
    c.set("flag", "maybe");
    EXPECT_FALSE(c.getBool("flag", false));
}

TEST_F(ConfigTest, PartialNumbersWarnAndFallBack) {
    Config& c = Config::instance();
    LogLevel previous = Logger::getLevel();
    Logger::setLevel(LogLevel::WARN);
    Logger::clearLogs();

    c.set("simulation.qubit_count", "12abc");
    c.set("simulation.qber_threshold", "0.2x");
    EXPECT_EQ(c.getInt64("simulation.qubit_count", 7), 7);
    EXPECT_DOUBLE_EQ(c.getDouble("simulation.qber_threshold", 0.11), 0.11);

    auto logs = Logger::getRecentLogs();
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0].level, LogLevel::WARN);
    EXPECT_NE(logs[0].message.find("simulation.qubit_count"), std::string::npos);
    EXPECT_NE(logs[1].message.find("simulation.qber_threshold"), std::string::npos);
    Logger::setLevel(previous);
}

TEST_F(ConfigTest, SignedSeedIsIgnored) {
    Config& c = Config::instance();
    c.set("simulation.seed", "-1");
    EXPECT_FALSE(c.getSimulationConfig().seed.has_value());
    c.set("simulation.seed", "+5");
    EXPECT_FALSE(c.getSimulationConfig().seed.has_value());
    c.set("simulation.seed", "99999999999999999999999");
    EXPECT_FALSE(c.getSimulationConfig().seed.has_value());
    c.set("simulation.seed", " 42 ");
    ASSERT_TRUE(c.getSimulationConfig().seed.has_value());
    EXPECT_EQ(*c.getSimulationConfig().seed, 42u);
}

TEST_F(ConfigTest, SimulationConfigSurvivesSaveAndLoad) {
    quantum::SimulationConfig in;
    in.protocol = quantum::Protocol::TELEPORTATION;
    in.qubitCount = 321;
    in.channelNoiseProbability = 0.0125;
    in.channelLossProbability = 0.2;
    in.disclosedSampleFraction = 0.3;
    in.qberThreshold = 0.09;
    in.minSiftedBits = 16;
    in.seed = 987654321;
    in.customBits = "0110";
    in.teleportationBasis = quantum::Basis::DIAGONAL;
    Config::instance().setSimulationConfig(in);

    std::string path = (testDir / "saved.conf").string();
    ASSERT_TRUE(Config::instance().save(path));
    Config::instance().reset();
    EXPECT_FALSE(Config::instance().has("simulation.seed"));
    ASSERT_TRUE(Config::instance().load(path));

    auto out = Config::instance().getSimulationConfig();
    EXPECT_EQ(out.protocol, in.protocol);
    EXPECT_EQ(out.qubitCount, in.qubitCount);
    EXPECT_DOUBLE_EQ(out.channelNoiseProbability, in.channelNoiseProbability);
    EXPECT_DOUBLE_EQ(out.channelLossProbability, in.channelLossProbability);
    EXPECT_DOUBLE_EQ(out.disclosedSampleFraction, in.disclosedSampleFraction);
    EXPECT_DOUBLE_EQ(out.qberThreshold, in.qberThreshold);
    EXPECT_EQ(out.minSiftedBits, in.minSiftedBits);
    EXPECT_EQ(out.seed, in.seed);
    EXPECT_EQ(out.customBits, in.customBits);
    EXPECT_EQ(out.teleportationBasis, in.teleportationBasis);
}

TEST_F(ConfigTest, ChangeCallbackSeesKey) {
    std::vector<std::string> changed;
    Config::instance().onChange([&changed](const std::string& key) { changed.push_back(key); });
    Config::instance().set("simulation.qubit_count", static_cast<int64_t>(64));
    Config::instance().set("log.console", false);
    ASSERT_EQ(changed.size(), 2u);
    EXPECT_EQ(changed[0], "simulation.qubit_count");
    EXPECT_EQ(changed[1], "log.console");
}

TEST_F(ConfigTest, KeysByPrefixAreSorted) {
    auto keys = Config::instance().keys("log.");
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "log.console");
    EXPECT_EQ(keys[1], "log.level");
    Config::instance().remove("log.level");
    EXPECT_FALSE(Config::instance().has("log.level"));
    EXPECT_EQ(Config::instance().keys("log.").size(), 1u);
    EXPECT_EQ(Config::instance().getString("log.console"), "true");
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::enableConsole(false);
        Logger::clearLogs();
        previous = Logger::getLevel();
    }

    void TearDown() override {
        Logger::setLevel(previous);
        Logger::setAllowSensitiveLogging(false);
    }

    LogLevel previous = LogLevel::WARN;
};

TEST_F(LoggerTest, ParsesLevelNames) {
    LogLevel level;
    ASSERT_TRUE(Logger::parseLevel("DEBUG", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    ASSERT_TRUE(Logger::parseLevel("warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    ASSERT_TRUE(Logger::parseLevel("off", level));
    EXPECT_EQ(level, LogLevel::OFF);
    ASSERT_TRUE(Logger::parseLevel("WARN", level));
    EXPECT_EQ(level, LogLevel::WARN);
    ASSERT_TRUE(Logger::parseLevel("Error", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(Logger::parseLevel("loud", level));
    EXPECT_FALSE(Logger::parseLevel("w\xC3\xA4rn", level));
}

TEST_F(LoggerTest, LevelFiltersEntries) {
    Logger::setLevel(LogLevel::WARN);
    Logger::info("quiet");
    Logger::warn("heard");
    Logger::log(LogLevel::ERROR, "classical", "rejected");

    auto logs = Logger::getRecentLogs(10);
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0].message, "heard");
    EXPECT_EQ(logs[1].category, "classical");
    EXPECT_EQ(logs[1].level, LogLevel::ERROR);
}

TEST_F(LoggerTest, CallbackReceivesEntries) {
    Logger::setLevel(LogLevel::INFO);
    std::vector<std::string> seen;
    Logger::onLog([&seen](const LogEntry& e) { seen.push_back(e.message); });
    LOG_INFO("run started");
    Logger::onLog(nullptr);
    LOG_INFO("run finished");
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "run started");
}

TEST_F(LoggerTest, RunTagScopesToThread) {
    Logger::setLevel(LogLevel::INFO);
    {
        ScopedRunTag tag("BB84#42");
        Logger::info("tagged");
        EXPECT_EQ(Logger::runTag(), "BB84#42");
    }
    Logger::info("untagged");
    auto logs = Logger::getRecentLogs(2);
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0].runTag, "BB84#42");
    EXPECT_TRUE(logs[1].runTag.empty());
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::setLevel(LogLevel::OFF);
    Logger::error("dropped");
    EXPECT_TRUE(Logger::getRecentLogs(10).empty());
}

TEST_F(LoggerTest, KeyMaterialIsRedacted) {
    EXPECT_EQ(Logger::redactKey("0110"), "[REDACTED_KEY 4 bits]");
    Logger::setAllowSensitiveLogging(true);
    EXPECT_EQ(Logger::redactKey("0110"), "0110");
}

TEST_F(LoggerTest, SecretsAreScrubbedFromMessages) {
    Logger::setLevel(LogLevel::INFO);
    Logger::info("secret=0110101");
    auto logs = Logger::getRecentLogs(1);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].message, "secret=[REDACTED]");
}

TEST_F(LoggerTest, WritesToFile) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "qkdsim_logger_test" / "run.log";
    std::filesystem::remove_all(path.parent_path());
    Logger::setLevel(LogLevel::INFO);
    Logger::init(path.string());
    ASSERT_TRUE(Logger::isInitialized());
    Logger::enableFile(true);
    Logger::info("persisted line");
    Logger::shutdown();
    EXPECT_FALSE(Logger::isInitialized());

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("[INFO"), std::string::npos);
    EXPECT_NE(content.str().find("persisted line"), std::string::npos);
    std::filesystem::remove_all(path.parent_path());
}

class ErrorHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorHandler::instance().clearErrors();
        ErrorHandler::instance().setHandler(nullptr);
    }
};

TEST_F(ErrorHandlerTest, CountsByCode) {
    ErrorHandler& h = ErrorHandler::instance();
    h.handle(ErrorCode::AUTHENTICATION_FAILED, "bad signature");
    h.handle(ErrorCode::AUTHENTICATION_FAILED, "bad signature");
    h.handle(ErrorCode::INVALID_BASIS, "22.5 is not a preparation basis");
    EXPECT_EQ(h.getErrorCount(), 3u);
    EXPECT_EQ(h.getErrorCount(ErrorCode::AUTHENTICATION_FAILED), 2u);
    EXPECT_EQ(h.getLastError().code, ErrorCode::INVALID_BASIS);
    EXPECT_TRUE(h.hasErrors());
}

TEST_F(ErrorHandlerTest, ScopedContextTagsErrors) {
    {
        ScopedContext ctx("compare");
        ErrorHandler::instance().handle(ErrorCode::RUN_CANCELLED, "stopped");
    }
    EXPECT_EQ(ErrorHandler::instance().getLastError().context, "compare");
    EXPECT_TRUE(ErrorHandler::instance().getContext().empty());
}

TEST_F(ErrorHandlerTest, ResultCarriesValueOrError) {
    Result<int> good(7);
    EXPECT_TRUE(good.ok());
    EXPECT_EQ(good.valueOr(0), 7);

    Result<int> bad(makeError(ErrorCode::INSUFFICIENT_SIFTED_BITS, "empty"));
    EXPECT_TRUE(bad.failed());
    EXPECT_EQ(bad.valueOr(-1), -1);
    EXPECT_STREQ(errorToString(bad.error().code), "Insufficient sifted bits");
}

TEST_F(ErrorHandlerTest, ExitStatusAndCodeNames) {
    EXPECT_EQ(exitStatus(ErrorCode::OK), 0);
    EXPECT_EQ(exitStatus(ErrorCode::RUN_CANCELLED), EXIT_RUN_CANCELLED);
    EXPECT_EQ(exitStatus(ErrorCode::AUTHENTICATION_FAILED), EXIT_RUN_FAILED);
    EXPECT_STREQ(errorCodeName(ErrorCode::INVALID_NOISE_PROBABILITY), "INVALID_NOISE_PROBABILITY");

    EXPECT_TRUE(makeError(ErrorCode::INVALID_BASIS, "x").isConfigurationError());
    EXPECT_FALSE(makeError(ErrorCode::INSUFFICIENT_SIFTED_BITS, "x").isConfigurationError());
}

TEST(FormatterTest, NumbersAndStrings) {
    EXPECT_EQ(Formatter::formatPercent(0.125, 1), "12.5%");
    EXPECT_EQ(Formatter::formatPercent(std::nan("")), "-");
    EXPECT_EQ(Formatter::formatFixed(0.5, 3), "0.500");
    EXPECT_EQ(Formatter::padLeft("7", 3, '0'), "007");
    EXPECT_EQ(Formatter::trim("  bb84\t\n"), "bb84");
    EXPECT_EQ(Formatter::trim(" \t "), "");
    EXPECT_EQ(Formatter::toLower("BBM92"), "bbm92");
}

TEST(FormatterTest, TableAlignsColumns) {
    TableFormatter table;
    table.setHeaders({"Protocol", "QBER"});
    table.alignRight(1);
    table.addRow({"BB84", "0.0%"});
    std::string out = table.render();
    EXPECT_NE(out.find("| Protocol | QBER |"), std::string::npos);
    EXPECT_NE(out.find("| BB84     | 0.0% |"), std::string::npos);

    TableFormatter wide;
    wide.setHeaders({"Sifted"});
    wide.alignRight(0);
    wide.addRow({"7"});
    EXPECT_NE(wide.render().find("|      7 |"), std::string::npos);
    EXPECT_EQ(wide.rowCount(), 1u);
}
