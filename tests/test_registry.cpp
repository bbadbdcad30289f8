/*
 * Registry, Lockout and Access Log Tests
 */

#include "test_support.h"
#include "../server/signaling/access_log.h"
#include "../server/signaling/lockout_policy.h"
#include "../server/signaling/registry.h"
#include <memory>

using signaling::LinkStatus;
using signaling::Registry;

static void attach_registered(Registry& registry, const std::string& client_id,
                              const std::string& connection_id, bool is_host) {
    registry.attach(client_id, std::make_shared<FakeConnection>(), "10.0.0.1", 0);
    registry.register_peer(client_id, connection_id, "hash", is_host, "", 0);
}

static bool test_link_is_symmetric() {
    Registry registry;
    attach_registered(registry, "h", "123456789", true);
    attach_registered(registry, "v", "987654321", false);

    signaling::LinkResult result = registry.link("v", "123456789", "session-1");
    TEST_ASSERT(result.status == LinkStatus::OK, "link ok");
    TEST_ASSERT(result.requester && result.target, "both sides returned");
    TEST_ASSERT(registry.find("h")->connected_to == "v", "host -> viewer");
    TEST_ASSERT(registry.find("v")->connected_to == "h", "viewer -> host");
    TEST_ASSERT(registry.find("h")->session_id == "session-1", "session id on host");
    TEST_ASSERT(registry.partner_of("v")->client_id == "h", "partner_of");

    signaling::UnlinkResult unlinked = registry.unlink("h");
    TEST_ASSERT(unlinked.partner && unlinked.partner->client_id == "v", "partner returned");
    TEST_ASSERT(!registry.find("h")->is_linked() && !registry.find("v")->is_linked(), "both unlinked");
    TEST_ASSERT(!registry.unlink("h").partner, "second unlink has no partner");
    return true;
}

static bool test_link_failures() {
    Registry registry;
    attach_registered(registry, "h", "123456789", true);
    attach_registered(registry, "v", "987654321", false);
    registry.attach("anon", std::make_shared<FakeConnection>(), "10.0.0.9", 0);

    TEST_ASSERT(registry.link("anon", "123456789", "s").status == LinkStatus::REQUESTER_UNKNOWN,
                "unregistered requester");
    TEST_ASSERT(registry.link("v", "000000000", "s").status == LinkStatus::TARGET_NOT_FOUND, "unknown target");
    TEST_ASSERT(registry.link("v", "987654321", "s").status == LinkStatus::TARGET_BUSY, "self link refused");

    attach_registered(registry, "v2", "111111111", false);
    registry.link("v", "123456789", "s1");
    TEST_ASSERT(registry.link("v2", "123456789", "s2").status == LinkStatus::TARGET_BUSY, "linked target busy");
    return true;
}

static bool test_relink_releases_previous_partner() {
    Registry registry;
    attach_registered(registry, "h1", "111111111", true);
    attach_registered(registry, "h2", "222222222", true);
    attach_registered(registry, "v", "987654321", false);

    registry.link("v", "111111111", "s1");
    signaling::LinkResult result = registry.link("v", "222222222", "s2");
    TEST_ASSERT(result.status == LinkStatus::OK, "relink ok");
    TEST_ASSERT(result.previous_partner && result.previous_partner->client_id == "h1", "old partner reported");
    TEST_ASSERT(!registry.find("h1")->is_linked(), "old partner unlinked");
    TEST_ASSERT(registry.find("h2")->connected_to == "v", "new partner linked");
    return true;
}

static bool test_remove_releases_id() {
    Registry registry;
    attach_registered(registry, "h", "123456789", true);
    attach_registered(registry, "v", "987654321", false);
    registry.link("v", "123456789", "s");

    signaling::UnlinkResult removed = registry.remove("h");
    TEST_ASSERT(removed.peer && removed.peer->connection_id == "123456789", "removed peer returned");
    TEST_ASSERT(removed.partner && removed.partner->client_id == "v", "partner returned");
    TEST_ASSERT(!registry.find_by_connection_id("123456789"), "ID released");
    TEST_ASSERT(!registry.find("v")->is_linked(), "partner unlinked");
    TEST_ASSERT(registry.size() == 1, "one client left");
    TEST_ASSERT(!registry.remove("h").peer, "removing twice is a no-op");
    return true;
}

static bool test_reregister_under_new_id() {
    Registry registry;
    attach_registered(registry, "h", "123456789", true);
    registry.register_peer("h", "555555555", "hash", true, "", 1);

    TEST_ASSERT(!registry.find_by_connection_id("123456789"), "old ID released");
    TEST_ASSERT(registry.find_by_connection_id("555555555")->client_id == "h", "new ID held");
    TEST_ASSERT(!registry.register_peer("ghost", "1", "hash", true, "", 1), "unattached client refused");
    return true;
}

static bool test_idle_clients() {
    Registry registry;
    registry.attach("a", std::make_shared<FakeConnection>(), "10.0.0.1", 0);
    registry.attach("b", std::make_shared<FakeConnection>(), "10.0.0.2", 0);
    registry.touch("a", 900);

    auto idle = registry.idle_clients(1500, 1000);
    TEST_ASSERT(idle.size() == 1 && idle[0].client_id == "b", "only b idle");
    TEST_ASSERT(registry.idle_clients(1000, 1000).empty(), "exactly at the timeout is not idle");
    TEST_ASSERT(!registry.touch("missing", 1), "unknown client not touched");
    return true;
}

static bool test_lockout_window() {
    signaling::LockoutPolicy policy(5, 1000);

    for (int i = 1; i <= 4; i++) {
        TEST_ASSERT(policy.record_failure("1.1.1.1", i * 10) == i, "failure counted");
        TEST_ASSERT(!policy.is_locked_out("1.1.1.1", i * 10), "not locked before the limit");
    }
    policy.record_failure("1.1.1.1", 50);
    TEST_ASSERT(policy.is_locked_out("1.1.1.1", 60), "locked at the limit");
    TEST_ASSERT(policy.is_rejected("1.1.1.1", 60), "rejected while locked");
    TEST_ASSERT(!policy.is_locked_out("2.2.2.2", 60), "other IP free");
    TEST_ASSERT(!policy.is_locked_out("1.1.1.1", 1050), "lock expires after the window");
    TEST_ASSERT(policy.record_failure("1.1.1.1", 1100) == 1, "count restarts after expiry");
    return true;
}

static bool test_block_list() {
    signaling::LockoutPolicy policy(5, 1000);
    policy.block("3.3.3.3");
    TEST_ASSERT(policy.is_blocked("3.3.3.3") && policy.is_rejected("3.3.3.3", 0), "blocked");
    TEST_ASSERT(policy.blocked_ips().size() == 1, "listed");
    TEST_ASSERT(policy.unblock("3.3.3.3"), "unblocked");
    TEST_ASSERT(!policy.unblock("3.3.3.3"), "not blocked any more");
    TEST_ASSERT(!policy.is_rejected("3.3.3.3", 0), "accepted again");
    return true;
}

static bool test_access_log_capacity() {
    signaling::AccessLog log(3);
    log.record("a", "1", "", "", true);
    log.record("b", "2", "", "", true);
    log.record("c", "3", "", "", true);
    log.record("d", "4", "x", "10.0.0.1", false);

    TEST_ASSERT(log.size() == 3, "bounded");
    auto latest = log.latest(10);
    TEST_ASSERT(latest.size() == 3 && latest[0].event == "d" && latest[2].event == "b", "newest first, oldest dropped");
    TEST_ASSERT(log.latest(1).size() == 1, "limit respected");

    json_utils::json j = signaling::AccessLog::to_json(latest[0]);
    TEST_ASSERT(j["event"] == "d" && j["targetId"] == "x" && j["ipAddress"] == "10.0.0.1", "json fields");
    TEST_ASSERT(j["success"] == false, "success flag");
    TEST_ASSERT(signaling::format_timestamp(0) == "1970-01-01T00:00:00.000Z", "ISO-8601 timestamp");
    return true;
}

int main() {
    fprintf(stderr, "=== Registry tests ===\n");

    RUN_TEST(test_link_is_symmetric);
    RUN_TEST(test_link_failures);
    RUN_TEST(test_relink_releases_previous_partner);
    RUN_TEST(test_remove_releases_id);
    RUN_TEST(test_reregister_under_new_id);
    RUN_TEST(test_idle_clients);
    RUN_TEST(test_lockout_window);
    RUN_TEST(test_block_list);
    RUN_TEST(test_access_log_capacity);

    if (tests_failed > 0) {
        fprintf(stderr, "%d test(s) failed\n", tests_failed);
        return 1;
    }
    fprintf(stderr, "All registry tests passed\n");
    return 0;
}
