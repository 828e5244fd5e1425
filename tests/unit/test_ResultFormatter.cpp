#include <catch2/catch_test_macros.hpp>

#include "infrastructure/output/ResultFormatter.hpp"

#include <filesystem>
#include <fstream>

using namespace netsweep::core;
using namespace netsweep::infra;
using namespace std::chrono_literals;

namespace {

HostRecord makeFullRecord() {
    auto record = HostRecord::fromFinding(
        ProbeFinding::linkLayer("192.168.1.20", "00:1a:2b:3c:4d:5e", "Example Corp"));
    record.merge(ProbeFinding::echo("192.168.1.20", 1500us));
    record.merge(ProbeFinding::connection("192.168.1.20"));
    record.hostname = "printer.lan";
    record.strategy = DiscoveryStrategy::Local;
    record.networkSegment = "192.168.1.0/24";

    PortRecord ssh;
    ssh.address = record.address;
    ssh.port = 22;
    ssh.transport = Transport::Tcp;
    ssh.state = PortState::Open;
    ssh.serviceName = "ssh";
    ssh.banner = "SSH-2.0-OpenSSH_9.6";
    record.mergePorts({ssh});
    return record;
}

HostRecord makeMinimalRecord() {
    auto record = HostRecord::fromFinding(ProbeFinding::connection("10.0.0.5"));
    record.networkSegment = "10.0.0.0/24";
    return record;
}

} // namespace

TEST_CASE("Summary counts", "[ResultFormatter]") {
    auto summary = DiscoverySummary::of({makeFullRecord(), makeMinimalRecord()});

    REQUIRE(summary.totalHosts == 2);
    REQUIRE(summary.byLinkLayer == 1);
    REQUIRE(summary.byEcho == 1);
    REQUIRE(summary.byConnection == 2);
    REQUIRE(summary.byAllMethods == 1);
    REQUIRE(summary.openPorts == 1);
}

TEST_CASE("Host record JSON", "[ResultFormatter]") {
    SECTION("Every field present") {
        auto j = ResultFormatter::toJson(makeFullRecord());

        REQUIRE(j["ip"] == "192.168.1.20");
        REQUIRE(j["arp_found"] == true);
        REQUIRE(j["icmp_found"] == true);
        REQUIRE(j["tcp_found"] == true);
        REQUIRE(j["methods"] == "arp, icmp, tcp");
        REQUIRE(j["strategy"] == "local");
        REQUIRE(j["network"] == "192.168.1.0/24");
        REQUIRE(j["mac"] == "00:1a:2b:3c:4d:5e");
        REQUIRE(j["vendor"] == "Example Corp");
        REQUIRE(j["hostname"] == "printer.lan");
        REQUIRE(j["rtt_ms"].get<double>() == 1.5);

        REQUIRE(j["open_ports"].size() == 1);
        const auto& port = j["open_ports"][0];
        REQUIRE(port["port"] == 22);
        REQUIRE(port["protocol"] == "tcp");
        REQUIRE(port["state"] == "open");
        REQUIRE(port["service"] == "ssh");
        REQUIRE(port["banner"] == "SSH-2.0-OpenSSH_9.6");
    }

    SECTION("Absent values are omitted") {
        auto j = ResultFormatter::toJson(makeMinimalRecord());

        REQUIRE(j["tcp_found"] == true);
        REQUIRE(j["arp_found"] == false);
        REQUIRE(j["strategy"] == "remote");
        REQUIRE_FALSE(j.contains("mac"));
        REQUIRE_FALSE(j.contains("vendor"));
        REQUIRE_FALSE(j.contains("hostname"));
        REQUIRE_FALSE(j.contains("rtt_ms"));
        REQUIRE(j["open_ports"].is_array());
        REQUIRE(j["open_ports"].empty());
    }
}

TEST_CASE("Result set JSON", "[ResultFormatter]") {
    auto j = ResultFormatter::toJson(std::vector<HostRecord>{makeFullRecord(), makeMinimalRecord()});

    REQUIRE(j["hosts"].size() == 2);
    REQUIRE(j["hosts"][0]["ip"] == "192.168.1.20");
    REQUIRE(j["summary"]["total_hosts"] == 2);
    REQUIRE(j["summary"]["arp"] == 1);
    REQUIRE(j["summary"]["tcp"] == 2);
    REQUIRE(j["summary"]["all_methods"] == 1);
    REQUIRE(j["summary"]["open_ports"] == 1);

    SECTION("Empty result") {
        auto empty = ResultFormatter::toJson(std::vector<HostRecord>{});
        REQUIRE(empty["hosts"].is_array());
        REQUIRE(empty["hosts"].empty());
        REQUIRE(empty["summary"]["total_hosts"] == 0);
    }
}

TEST_CASE("Text report", "[ResultFormatter]") {
    SECTION("No hosts") {
        REQUIRE(ResultFormatter::formatText({}) == "No live hosts found.\n");
    }

    SECTION("Table and summary") {
        auto text = ResultFormatter::formatText({makeFullRecord(), makeMinimalRecord()});

        REQUIRE(text.rfind("IP", 0) == 0);
        REQUIRE(text.find("192.168.1.20") != std::string::npos);
        REQUIRE(text.find("00:1a:2b:3c:4d:5e") != std::string::npos);
        REQUIRE(text.find("1.50ms") != std::string::npos);
        REQUIRE(text.find("printer.lan") != std::string::npos);
        REQUIRE(text.find("    22/tcp ssh  SSH-2.0-OpenSSH_9.6") != std::string::npos);
        REQUIRE(text.find("Hosts found:      2") != std::string::npos);
        REQUIRE(text.find("  via ARP:        1") != std::string::npos);
        REQUIRE(text.find("  via TCP:        2") != std::string::npos);
        REQUIRE(text.find("Open ports:       1") != std::string::npos);
        REQUIRE(text.find("192.168.1.20") < text.find("10.0.0.5"));
    }
}

TEST_CASE("JSON file output", "[ResultFormatter]") {
    auto path = std::filesystem::temp_directory_path() / "netsweep_results_test.json";
    std::filesystem::remove(path);

    REQUIRE(ResultFormatter::writeJson(path, {makeMinimalRecord()}));

    std::ifstream file(path);
    auto j = nlohmann::json::parse(file);
    REQUIRE(j["hosts"][0]["ip"] == "10.0.0.5");

    file.close();
    std::filesystem::remove(path);

    SECTION("Unwritable path") {
        REQUIRE_FALSE(ResultFormatter::writeJson("/nonexistent-dir/out.json", {}));
    }
}
