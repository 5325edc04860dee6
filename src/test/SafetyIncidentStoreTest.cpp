#undef NDEBUG // Assertions must stay active in every build type.
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/SafetyEngine.hpp"
#include "application/stages/ContentFilterStage.hpp"
#include "domain/SafetyErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SafetyIncidentStoreFs.hpp"

namespace fs = std::filesystem;
using namespace sunflower;
using namespace std::chrono;
using infrastructure::PersistenceService;
using infrastructure::SafetyIncidentStoreFs;

namespace {

domain::SafetyIncident MakeIncident(const std::string& id, const std::string& child,
                                    system_clock::time_point when, domain::SafetyCategory category) {
    domain::SafetyIncident incident;
    incident.id = id;
    incident.timestamp = when;
    incident.childId = child;
    incident.childAge = 9;
    incident.sessionId = "session-" + id;
    incident.inputText = "input for " + id;
    incident.category = category;
    incident.severity = domain::SeverityLevel::Severe;
    incident.actionTaken = "blocked_and_redirected";
    incident.parentNotified = true;
    incident.details = {{"flags", {"personal_info:personal"}}, {"source", "input"}};
    return incident;
}

std::size_t CountLines(const std::string& path) {
    std::ifstream f(path);
    std::string line;
    std::size_t count = 0;
    while (std::getline(f, line)) {
        if (!line.empty()) ++count;
    }
    return count;
}

} // namespace

static void testSaveAndQuery(const fs::path& root) {
    auto persistence = std::make_shared<PersistenceService>();
    SafetyIncidentStoreFs store(root.string(), persistence);

    system_clock::time_point t0 = time_point_cast<milliseconds>(system_clock::now());
    store.save(MakeIncident("c", "kid-1", t0 + hours(2), domain::SafetyCategory::Violence));
    store.save(MakeIncident("a", "kid-1", t0, domain::SafetyCategory::PersonalInfo));
    store.save(MakeIncident("b", "kid-1", t0 + hours(1), domain::SafetyCategory::Bullying));
    store.save(MakeIncident("x", "kid-2", t0 + hours(1), domain::SafetyCategory::Scary));

    auto all = store.findByChild("kid-1", t0, t0 + hours(2));
    assert(all.size() == 3);
    assert(all[0].id == "a" && all[1].id == "b" && all[2].id == "c");

    auto window = store.findByChild("kid-1", t0 + minutes(30), t0 + hours(2));
    assert(window.size() == 2);
    assert(window[0].id == "b");

    assert(store.findByChild("kid-1", t0 + hours(3), t0 + hours(4)).empty());
    assert(store.findByChild("nobody", t0, t0 + hours(4)).empty());

    bool rejected = false;
    try {
        store.save(MakeIncident("", "kid-1", t0, domain::SafetyCategory::Violence));
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);

    persistence->flush();
    std::string path = store.getIncidentFilePath("kid-1");
    assert(fs::path(path) == root / "incidents" / "kid-1.ndjson");
    assert(CountLines(path) == 3);
    assert(persistence->failedWrites() == 0);
    persistence->stop();
    std::cout << "[PASS] Incidents are stored per child and queried by time range." << std::endl;
}

static void testRehydration(const fs::path& root) {
    auto persistence = std::make_shared<PersistenceService>();
    SafetyIncidentStoreFs store(root.string(), persistence);

    auto incidents = store.findByChild("kid-1", system_clock::time_point::min(), system_clock::time_point::max());
    assert(incidents.size() == 3);
    assert(incidents[0].category == domain::SafetyCategory::PersonalInfo);
    assert(incidents[0].severity == domain::SeverityLevel::Severe);
    assert(incidents[0].sessionId == "session-a");
    assert(incidents[0].inputText == "input for a");
    assert(incidents[0].parentNotified);
    assert(incidents[0].details["flags"][0] == "personal_info:personal");

    // Appending after a reload keeps the earlier records.
    store.save(MakeIncident("d", "kid-1", system_clock::now(), domain::SafetyCategory::Dangerous));
    persistence->flush();
    assert(CountLines(store.getIncidentFilePath("kid-1")) == 4);
    persistence->stop();
    std::cout << "[PASS] A new store reads existing logs from disk." << std::endl;
}

static void testUnsafeChildIds(const fs::path& root) {
    auto persistence = std::make_shared<PersistenceService>();
    SafetyIncidentStoreFs store(root.string(), persistence);

    fs::path path = store.getIncidentFilePath("../evil");
    assert(path.parent_path() == root / "incidents");
    assert(path.filename() == "___evil.ndjson");
    assert(fs::path(store.getIncidentFilePath("")).filename() == "_unknown.ndjson");

    // Two ids that sanitize to the same file stay separate in queries.
    auto now = system_clock::now();
    store.save(MakeIncident("e1", "kid/7", now, domain::SafetyCategory::Violence));
    store.save(MakeIncident("e2", "kid_7", now, domain::SafetyCategory::Violence));
    auto slashed = store.findByChild("kid/7", now - seconds(1), now + seconds(1));
    assert(slashed.size() == 1 && slashed[0].id == "e1");
    persistence->stop();
    std::cout << "[PASS] Child ids never escape the incident directory." << std::endl;
}

static void testMalformedLinesAreSkipped(const fs::path& root) {
    auto persistence = std::make_shared<PersistenceService>();
    SafetyIncidentStoreFs store(root.string(), persistence);

    std::string path = store.getIncidentFilePath("kid-9");
    fs::create_directories(fs::path(path).parent_path());
    {
        auto good = MakeIncident("ok", "kid-9", system_clock::now(), domain::SafetyCategory::Scary);
        nlohmann::json bad = SafetyIncidentStoreFs::ToJson(good);
        bad["category"] = "nonsense";
        std::ofstream f(path);
        f << SafetyIncidentStoreFs::ToJson(good).dump() << "\n";
        f << "{ this is not json\n";
        f << bad.dump() << "\n";
    }

    auto incidents = store.findByChild("kid-9", system_clock::time_point::min(), system_clock::time_point::max());
    assert(incidents.size() == 1);
    assert(incidents[0].id == "ok");
    persistence->stop();
    std::cout << "[PASS] Malformed records are skipped on load." << std::endl;
}

static void testCacheIsBounded(const fs::path& root) {
    auto persistence = std::make_shared<PersistenceService>();
    SafetyIncidentStoreFs store(root.string(), persistence, 2);

    auto now = time_point_cast<milliseconds>(system_clock::now());
    store.save(MakeIncident("la", "lru-a", now, domain::SafetyCategory::Violence));
    store.save(MakeIncident("lb", "lru-b", now, domain::SafetyCategory::Violence));
    store.save(MakeIncident("lc", "lru-c", now, domain::SafetyCategory::Violence));
    assert(store.cachedLogCount() == 2);

    // The evicted log is read back from disk, including its queued append.
    auto a = store.findByChild("lru-a", now - seconds(1), now + seconds(1));
    assert(a.size() == 1 && a[0].id == "la");
    assert(store.cachedLogCount() == 2);

    store.save(MakeIncident("la2", "lru-a", now + seconds(1), domain::SafetyCategory::Scary));
    persistence->flush();
    assert(CountLines(store.getIncidentFilePath("lru-a")) == 2);
    assert(store.findByChild("lru-a", now - seconds(1), now + seconds(2)).size() == 2);

    bool rejected = false;
    try {
        SafetyIncidentStoreFs unbounded(root.string(), persistence, 0);
    } catch (const domain::ConfigurationError&) {
        rejected = true;
    }
    assert(rejected);
    persistence->stop();
    std::cout << "[PASS] Only a bounded number of child logs stay in memory." << std::endl;
}

static void testContentFilterTruncatesStoredInput(const fs::path& root) {
    auto config = infrastructure::ConfigLoader::LoadDefaults();
    auto engine = std::make_shared<application::SafetyEngine>(config);
    auto persistence = std::make_shared<PersistenceService>();
    auto store = std::make_shared<SafetyIncidentStoreFs>(root.string(), persistence);
    application::stages::ContentFilterStage stage(config, engine, store);

    std::string input = "bomb ";
    for (int i = 0; i < 300; ++i) input += "\xC3\xA9";  // e-acute, two bytes each

    domain::PipelineContext context;
    context.sessionId = "s-utf8";
    context.profileId = "kid-utf8";
    context.childAge = 12;
    context.inputText = input;
    auto verdict = stage.apply(context);
    assert(!verdict.safe);

    auto incidents = store->findByChild("kid-utf8", system_clock::time_point::min(), system_clock::time_point::max());
    assert(incidents.size() == 1);
    const std::string& stored = incidents[0].inputText;
    assert(stored.size() <= config->policy.incidentTextLimit);
    assert(stored.size() >= config->policy.incidentTextLimit - 1);
    assert(stored.rfind("bomb ", 0) == 0);
    assert((stored.size() - 5) % 2 == 0);
    assert(incidents[0].details["source"] == "input");
    persistence->stop();
    std::cout << "[PASS] Stored input is truncated on a character boundary." << std::endl;
}

int main() {
    std::cout << "[Test] Starting SafetyIncidentStore Test..." << std::endl;

    fs::path root = fs::temp_directory_path() / "sunflower_incident_test";
    fs::remove_all(root);
    fs::create_directories(root);

    testSaveAndQuery(root);
    testRehydration(root);
    testUnsafeChildIds(root);
    testMalformedLinesAreSkipped(root);
    testCacheIsBounded(root);
    testContentFilterTruncatesStoredInput(root);

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
