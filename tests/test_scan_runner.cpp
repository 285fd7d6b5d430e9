#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <set>
#include <sstream>
#include "console.hpp"
#include "endpoint_prober.hpp"
#include "loopback_server.hpp"
#include "scan_runner.hpp"

// Matches only the listed address:port pairs.
class ScriptedProber : public Prober {
public:
    explicit ScriptedProber(std::set<std::pair<uint32_t, uint16_t>> matches, bool openRest = false)
        : matches_(matches), openRest_(openRest) {}

    ProbeResult probe(const ProbeUnit& unit) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            probed_.insert(std::make_pair(unit.address, unit.port));
        }
        ProbeResult result;
        result.unit = unit;
        if (matches_.count(std::make_pair(unit.address, unit.port))) {
            result.outcome = ProbeOutcome::Match;
            result.scheme = "http";
            result.status = 200;
            result.label = "MikroTik RouterOS";
        } else if (openRest_) {
            result.outcome = ProbeOutcome::Open;
            result.scheme = "tcp";
            result.label = "open port";
        }
        return result;
    }

    std::set<std::pair<uint32_t, uint16_t>> probed() {
        std::lock_guard<std::mutex> lock(mutex_);
        return probed_;
    }

private:
    std::set<std::pair<uint32_t, uint16_t>> matches_;
    bool openRest_;
    std::mutex mutex_;
    std::set<std::pair<uint32_t, uint16_t>> probed_;
};

class FixedPrefixSource : public AsnPrefixSource {
public:
    explicit FixedPrefixSource(std::vector<Cidr> prefixes, bool fail = false)
        : prefixes_(prefixes), fail_(fail) {}

    std::vector<Cidr> announcedPrefixes(const std::string& asn) override {
        requested = asn;
        if (fail_) throw LookupFailure("lookup unavailable");
        return prefixes_;
    }

    std::string requested;

private:
    std::vector<Cidr> prefixes_;
    bool fail_;
};

class RecordingObserver : public ScanObserver {
public:
    void scanStarting(const ScanPlan& plan) override { plannedPorts = plan.ports.size(); }
    void scanFinished(const ScanSummary& summary) override { finished = summary.completed; }

    size_t plannedPorts = 0;
    uint64_t finished = 0;
};

static uint32_t ip(const char* text) {
    uint32_t value = 0;
    EXPECT_TRUE(parseIPv4(text, value));
    return value;
}

static std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) out.push_back(line);
    return out;
}

class ScanRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = logLevel();
        setLogLevel(LogLevel::Error);
    }
    void TearDown() override { setLogLevel(previous_); }

    FixedPrefixSource noAsn_{std::vector<Cidr>()};
    LogLevel previous_;
};

TEST_F(ScanRunnerTest, RangeWithOneMatchPrintsOneLine) {
    ScanConfig config;
    config.target = "10.0.0.1-10.0.0.3";
    config.portsSpec = "80";
    ScriptedProber prober({std::make_pair(ip("10.0.0.2"), uint16_t(80))});
    std::ostringstream out;

    EXPECT_EQ(runScan(config, prober, noAsn_, out), 0);
    std::vector<std::string> printed = lines(out.str());
    ASSERT_EQ(printed.size(), 1u);
    EXPECT_EQ(printed[0], "10.0.0.2:80 -> MikroTik RouterOS [200] http://10.0.0.2:80/");
    EXPECT_EQ(prober.probed().size(), 3u);
}

TEST_F(ScanRunnerTest, UnreachableHostPrintsNothingAndSucceeds) {
    ScanConfig config;
    config.target = "10.0.0.5/32";
    ScriptedProber prober({});
    std::ostringstream out;

    EXPECT_EQ(runScan(config, prober, noAsn_, out), 0);
    EXPECT_TRUE(out.str().empty());
    std::set<std::pair<uint32_t, uint16_t>> expected = {
        {ip("10.0.0.5"), 80}, {ip("10.0.0.5"), 443}, {ip("10.0.0.5"), 8080}};
    EXPECT_EQ(prober.probed(), expected);
}

TEST_F(ScanRunnerTest, OpenLinesOnlyWhenRequested) {
    ScanConfig config;
    config.target = "10.0.0.7";
    config.portsSpec = "80,8291";
    ScriptedProber prober({std::make_pair(ip("10.0.0.7"), uint16_t(80))}, true);

    std::ostringstream quiet;
    EXPECT_EQ(runScan(config, prober, noAsn_, quiet), 0);
    EXPECT_EQ(lines(quiet.str()).size(), 1u);

    config.reportOpen = true;
    std::ostringstream verbose;
    EXPECT_EQ(runScan(config, prober, noAsn_, verbose), 0);
    std::vector<std::string> printed = lines(verbose.str());
    ASSERT_EQ(printed.size(), 2u);
    std::set<std::string> got(printed.begin(), printed.end());
    EXPECT_EQ(got.count("10.0.0.7:8291 -> open port [tcp] tcp://10.0.0.7:8291/"), 1u);
}

TEST_F(ScanRunnerTest, InputErrorsExitNonZero) {
    ScriptedProber prober({});
    std::ostringstream out;

    ScanConfig badTarget;
    badTarget.target = "10.0.0.300";
    EXPECT_EQ(runScan(badTarget, prober, noAsn_, out), 1);

    ScanConfig badPorts;
    badPorts.target = "10.0.0.1";
    badPorts.portsSpec = "0";
    EXPECT_EQ(runScan(badPorts, prober, noAsn_, out), 1);

    ScanConfig reversed;
    reversed.target = "10.0.0.9-10.0.0.1";
    EXPECT_EQ(runScan(reversed, prober, noAsn_, out), 1);

    ScanConfig nothing;
    EXPECT_EQ(runScan(nothing, prober, noAsn_, out), 1);

    EXPECT_TRUE(prober.probed().empty());
    EXPECT_TRUE(out.str().empty());
}

TEST_F(ScanRunnerTest, AsnTargetUsesPrefixSource) {
    Cidr block;
    ASSERT_TRUE(parseCidr("192.0.2.0/29", block));
    FixedPrefixSource source({block});
    ScanConfig config;
    config.target = "as64500";
    config.portsSpec = "80";
    ScriptedProber prober({});
    std::ostringstream out;

    EXPECT_EQ(runScan(config, prober, source, out), 0);
    EXPECT_EQ(source.requested, "64500");
    EXPECT_EQ(prober.probed().size(), 6u);
}

TEST_F(ScanRunnerTest, AsnSamplingLimitsEachPrefix) {
    Cidr a;
    Cidr b;
    ASSERT_TRUE(parseCidr("198.51.100.0/24", a));
    ASSERT_TRUE(parseCidr("203.0.113.0/24", b));
    FixedPrefixSource source({a, b});
    ScanConfig config;
    config.target = "AS64501";
    config.portsSpec = "80";
    config.sampled = true;
    config.samplePerPrefix = 3;
    ScriptedProber prober({});
    std::ostringstream out;

    EXPECT_EQ(runScan(config, prober, source, out), 0);
    EXPECT_EQ(prober.probed().size(), 6u);
}

TEST_F(ScanRunnerTest, SampleOptionLeavesOperatorCidrWhole) {
    ScanConfig config;
    config.target = "10.3.0.0/28";
    config.portsSpec = "80";
    config.sampled = true;
    config.samplePerPrefix = 2;
    ScriptedProber prober({});
    std::ostringstream out;

    EXPECT_EQ(runScan(config, prober, noAsn_, out), 0);
    EXPECT_EQ(prober.probed().size(), 14u);
}

TEST_F(ScanRunnerTest, LookupFailureAndEmptyAsnExitNonZero) {
    ScanConfig config;
    config.target = "AS64502";
    ScriptedProber prober({});
    std::ostringstream out;

    FixedPrefixSource failing({}, true);
    EXPECT_EQ(runScan(config, prober, failing, out), 1);

    FixedPrefixSource empty({});
    EXPECT_EQ(runScan(config, prober, empty, out), 1);
    EXPECT_TRUE(prober.probed().empty());
}

TEST_F(ScanRunnerTest, PrefixFileMergedWithTarget) {
    std::string path = ::testing::TempDir() + "figscan_runner_prefixes.txt";
    {
        std::ofstream file(path);
        file << "10.1.0.0/30\n# comment\n10.1.0.0/31\n";
    }
    ScanConfig config;
    config.asnFile = path;
    config.target = "10.1.0.2";
    config.portsSpec = "80";
    ScriptedProber prober({});
    std::ostringstream out;

    EXPECT_EQ(runScan(config, prober, noAsn_, out), 0);
    std::remove(path.c_str());
    // 10.1.0.1 and .2 from the /30, .0 and .1 from the /31.
    EXPECT_EQ(prober.probed().size(), 3u);
}

TEST_F(ScanRunnerTest, MissingPrefixFileExitsNonZero) {
    ScanConfig config;
    config.asnFile = ::testing::TempDir() + "figscan_no_such_file.txt";
    ScriptedProber prober({});
    std::ostringstream out;
    EXPECT_EQ(runScan(config, prober, noAsn_, out), 1);
}

TEST_F(ScanRunnerTest, ObserverSeesBothPhases) {
    ScanConfig config;
    config.target = "10.0.0.1";
    config.portsSpec = "80-84";
    ScriptedProber prober({});
    RecordingObserver observer;
    std::ostringstream out;

    EXPECT_EQ(runScan(config, prober, noAsn_, out, &observer), 0);
    EXPECT_EQ(observer.plannedPorts, 5u);
    EXPECT_EQ(observer.finished, 5u);
}

TEST_F(ScanRunnerTest, RealProberAgainstLoopback) {
    LoopbackServer router(httpResponse(200, "", "<title>RouterOS router configuration page</title>"));
    ScanConfig config;
    config.target = "127.0.0.1";
    config.portsSpec = std::to_string(router.port()) + "," + std::to_string(closedLoopbackPort());
    config.concurrency = 4;

    ProberOptions options;
    options.timeout = std::chrono::milliseconds(1000);
    EndpointProber prober(options, SignatureDetector::mikrotik());
    std::ostringstream out;

    EXPECT_EQ(runScan(config, prober, noAsn_, out), 0);
    std::vector<std::string> printed = lines(out.str());
    ASSERT_EQ(printed.size(), 1u);
    std::string port = std::to_string(router.port());
    EXPECT_EQ(printed[0], "127.0.0.1:" + port + " -> MikroTik RouterOS [200] http://127.0.0.1:" + port + "/");
}
