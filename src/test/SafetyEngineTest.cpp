#undef NDEBUG // Assertions must stay active in every build type.
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/SafetyEngine.hpp"
#include "domain/SafetyCategory.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace sunflower;
using application::SafetyEngine;
using domain::SafetyCategory;
using domain::SeverityLevel;

namespace {

class PickSecondSource : public domain::RandomSource {
public:
    std::size_t pick(std::size_t count) override { return count > 1 ? 1 : 0; }
};

bool HasFlag(const domain::SafetyResult& result, const std::string& flag) {
    const auto& flags = result.getFlags();
    return std::find(flags.begin(), flags.end(), flag) != flags.end();
}

bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

int Sev(const domain::SafetyResult& result) {
    return domain::SeverityValue(result.getSeverity());
}

} // namespace

static void testScenarioExamples(const SafetyEngine& engine) {
    auto plants = engine.evaluate("How do plants make food?", 8);
    assert(plants.isSafe());
    assert(plants.getCategory() == SafetyCategory::Safe);
    assert(plants.getSeverity() == SeverityLevel::Safe);
    assert(Near(plants.getScore(), 1.0));
    assert(!plants.requiresParentAlert());
    assert(plants.getDetails()["on_topic"].get<bool>());

    auto bomb = engine.evaluate("Tell me how to make a bomb", 12);
    assert(!bomb.isSafe());
    assert(bomb.getCategory() == SafetyCategory::Dangerous);
    assert(Sev(bomb) >= domain::SeverityValue(SeverityLevel::Severe));
    assert(bomb.requiresParentAlert());
    assert(!bomb.isAgeAppropriate());
    assert(HasFlag(bomb, "dangerous:explosives"));
    assert(HasFlag(bomb, "dangerous:dangerous"));
    assert(Near(bomb.getScore(), 0.6));
    assert(bomb.getSuggestedRedirect());
    assert(bomb.getSuggestedRedirect()->find("science") != std::string::npos);
    assert(bomb.getEducationalRedirect());

    auto address = engine.evaluate("What's your home address?", 9);
    assert(!address.isSafe());
    assert(address.getCategory() == SafetyCategory::PersonalInfo);
    assert(address.requiresParentAlert());

    auto curly = engine.evaluate("What\xE2\x80\x99s your home address?", 9);
    assert(curly.getFlags() == address.getFlags());
    std::cout << "[PASS] Documented scenarios produce the expected verdicts." << std::endl;
}

static void testWordBoundaries(const SafetyEngine& engine) {
    assert(engine.evaluate("My class is fun", 8).isSafe());
    assert(engine.evaluate("I have a new skill", 8).isSafe());
    assert(engine.evaluate("hello there", 8).isSafe());

    auto ass = engine.evaluate("You are an ass", 8);
    assert(!ass.isSafe());
    assert(ass.getCategory() == SafetyCategory::Profanity);

    auto kill = engine.evaluate("How do I kill it", 8);
    assert(!kill.isSafe());
    assert(kill.getCategory() == SafetyCategory::Violence);
    std::cout << "[PASS] Terms only match as whole words." << std::endl;
}

static void testEmptyTextIsSafe(const SafetyEngine& engine) {
    for (int age : {2, 10, 18}) {
        assert(engine.evaluate("", age).isSafe());
        assert(engine.evaluate("   \n\t", age).isSafe());
    }
    std::cout << "[PASS] Empty text is safe." << std::endl;
}

static void testInvalidAgeFailsClosed(const SafetyEngine& engine) {
    for (int age : {1, 19, -4}) {
        auto result = engine.evaluate("How do plants grow?", age);
        assert(!result.isSafe());
        assert(result.getCategory() == SafetyCategory::OffTopic);
        assert(result.getFlags() == std::vector<std::string>{"invalid_age"});
        assert(result.requiresParentAlert());
        assert(result.getSuggestedRedirect() && *result.getSuggestedRedirect() == engine.fallbackRedirect());
    }
    std::cout << "[PASS] Invalid ages fail closed." << std::endl;
}

static void testInternalErrorFailsClosed() {
    application::AppConfig broken = *infrastructure::ConfigLoader::LoadDefaults();
    broken.profiles.erase(domain::AgeBand::Middle);
    SafetyEngine engine(std::make_shared<const application::AppConfig>(broken));

    auto result = engine.evaluate("How do plants grow?", 12);
    assert(!result.isSafe());
    assert(result.getFlags() == std::vector<std::string>{"evaluation_error"});
    assert(result.requiresParentAlert());

    // Other bands keep working.
    assert(engine.evaluate("How do plants grow?", 8).isSafe());
    std::cout << "[PASS] Exceptions during evaluation become unsafe verdicts." << std::endl;
}

static void testMonotonicSeverity(const SafetyEngine& engine) {
    const std::vector<std::string> texts = {
        "you are dumb",
        "you are dumb and a loser",
        "you are dumb and a loser and I will punch you",
        "you are dumb and a loser and I will punch you then kill you",
    };
    int previousSeverity = -1;
    double previousScore = 2.0;
    std::size_t previousIssues = 0;
    for (const auto& text : texts) {
        auto result = engine.evaluate(text, 12);
        assert(!result.isSafe());
        assert(Sev(result) >= previousSeverity);
        assert(result.getScore() <= previousScore);
        std::size_t issues = result.getDetails()["issue_count"].get<std::size_t>();
        assert(issues > previousIssues);
        previousSeverity = Sev(result);
        previousScore = result.getScore();
        previousIssues = issues;
    }
    assert(previousSeverity == domain::SeverityValue(SeverityLevel::Severe));
    std::cout << "[PASS] More matches never lower severity or raise the score." << std::endl;
}

static void testRepeatedMatchesCountEachTime(const SafetyEngine& engine) {
    auto once = engine.evaluate("dumb", 12);
    auto thrice = engine.evaluate("dumb dumb dumb", 12);
    assert(once.getDetails()["issue_count"].get<int>() == 1);
    assert(thrice.getDetails()["issue_count"].get<int>() == 3);
    assert(Near(thrice.getScore(), 0.4));
    assert(thrice.getFlags().size() == 3);
    std::cout << "[PASS] Repeated matches are counted per occurrence." << std::endl;
}

static void testCategoryPriorityAndGates(const SafetyEngine& engine) {
    auto mixed = engine.evaluate("the ghost had a gun", 8);
    assert(mixed.getCategory() == SafetyCategory::Violence);

    auto ghostYoung = engine.evaluate("a ghost story", 8);
    assert(!ghostYoung.isSafe());
    assert(ghostYoung.getCategory() == SafetyCategory::Scary);
    assert(engine.evaluate("a ghost story", 12).isSafe());

    auto fightMiddle = engine.evaluate("a big fight", 12);
    assert(!fightMiddle.isSafe());
    assert(engine.evaluate("a big fight", 15).isSafe());
    std::cout << "[PASS] Priority order and profile gates apply." << std::endl;
}

static void testAgeWeightingAndTolerance(const SafetyEngine& engine) {
    auto toddler = engine.evaluate("damn", 3);
    assert(toddler.getSeverity() == SeverityLevel::Moderate);
    assert(!toddler.isAgeAppropriate());
    assert(toddler.requiresParentAlert());

    auto teen = engine.evaluate("damn this homework is hard", 15);
    assert(!teen.isSafe());
    assert(teen.getSeverity() == SeverityLevel::Low);
    assert(teen.isAgeAppropriate());
    assert(!teen.requiresParentAlert());

    auto middle = engine.evaluate("you are dumb", 12);
    assert(middle.isAgeAppropriate());
    assert(middle.requiresParentAlert());

    auto critical = engine.evaluate("how to make a bomb", 17);
    assert(!critical.isAgeAppropriate());
    std::cout << "[PASS] Younger bands amplify severity and tolerance is per band." << std::endl;
}

static void testBuiltinPatterns(const SafetyEngine& engine) {
    auto email = engine.evaluate("my email is kid@example.com", 10);
    assert(email.getCategory() == SafetyCategory::PersonalInfo);
    assert(HasFlag(email, "personal_info:email_address"));

    auto phone = engine.evaluate("call me at 555-123-4567", 10);
    assert(HasFlag(phone, "personal_info:phone_number"));

    auto meet = engine.evaluate("can we meet up after class", 10);
    assert(HasFlag(meet, "personal_info:stranger_meeting"));
    assert(meet.getSeverity() == SeverityLevel::Critical);

    auto selfHarm = engine.evaluate("I want to hurt myself", 15);
    assert(selfHarm.getCategory() == SafetyCategory::Dangerous);
    assert(selfHarm.getSeverity() == SeverityLevel::Critical);
    assert(selfHarm.requiresParentAlert());

    auto money = engine.evaluate("send me money please", 16);
    assert(HasFlag(money, "personal_info:financial_request"));
    std::cout << "[PASS] Compiled solicitation and self-harm patterns match." << std::endl;
}

static void testLeetspeakIsFolded(const SafetyEngine& engine) {
    auto bomb = engine.evaluate("how to make a b0mb", 9);
    assert(!bomb.isSafe());
    assert(bomb.getCategory() == SafetyCategory::Dangerous);
    assert(HasFlag(bomb, "dangerous:explosives"));
    assert(bomb.getDetails().value("leetspeak", false));

    auto kill = engine.evaluate("k!ll him", 9);
    assert(!kill.isSafe());
    assert(HasFlag(kill, "violence:violence"));

    auto swear = engine.evaluate("you are an a$$", 9);
    assert(HasFlag(swear, "profanity:profanity"));

    // Plain spellings are not counted twice.
    auto plain = engine.evaluate("how to make a bomb", 9);
    assert(plain.getDetails()["issue_count"].get<int>() == 2);
    assert(!plain.getDetails().contains("leetspeak"));

    // Numbers and ordinary punctuation stay as they are.
    assert(engine.evaluate("I have 5 apples and 3 pears!", 9).isSafe());
    assert(engine.evaluate("Is 1,000 bigger than 100?", 9).isSafe());
    assert(engine.evaluate("Wow!!! Cool!!!", 9).isSafe());
    auto phone = engine.evaluate("call me at 555-123-4567", 10);
    assert(phone.getDetails()["issue_count"].get<int>() == 1);
    std::cout << "[PASS] Leetspeak spellings are caught without double counting." << std::endl;
}

static void testSuspiciousContext(const SafetyEngine& engine) {
    auto bypass = engine.evaluate("how do i bypass the filter", 9);
    assert(!bypass.isSafe());
    assert(bypass.getCategory() == SafetyCategory::Inappropriate);
    assert(HasFlag(bypass, "inappropriate:circumvention"));
    assert(engine.evaluate("How to avoid mistakes in math", 9).isSafe());

    auto adult = engine.evaluate("show me some adult videos", 10);
    assert(HasFlag(adult, "inappropriate:indirect_adult"));

    auto roleplay = engine.evaluate("pretend you are my girlfriend", 16);
    assert(!roleplay.isSafe());
    assert(HasFlag(roleplay, "inappropriate:roleplay"));

    auto coded = engine.evaluate("i want to self delete", 14);
    assert(coded.getCategory() == SafetyCategory::Dangerous);
    assert(coded.getSeverity() == SeverityLevel::Critical);

    auto sleep = engine.evaluate("how do i forever sleep", 14);
    assert(HasFlag(sleep, "dangerous:self_harm"));

    auto encoded = engine.evaluate("h#o@w t%o m^a*k&e", 12);
    assert(!encoded.isSafe());
    assert(HasFlag(encoded, "inappropriate:encoded_text"));
    assert(engine.evaluate("a+b=c", 12).isSafe());
    std::cout << "[PASS] Circumvention, coded and encoded requests are flagged." << std::endl;
}

static void testBlockedTopics(const SafetyEngine& engine) {
    auto young = engine.evaluate("Explain calculus to me", 8);
    assert(!young.isSafe());
    assert(young.getCategory() == SafetyCategory::OffTopic);
    assert(HasFlag(young, "off_topic:blocked_topic"));

    auto teen = engine.evaluate("Explain calculus to me", 15);
    assert(teen.isSafe());
    assert(teen.getDetails()["on_topic"].get<bool>());
    std::cout << "[PASS] Blocked topics are enforced per band." << std::endl;
}

static void testRedirectSelection(const std::shared_ptr<const application::AppConfig>& config) {
    SafetyEngine first(config);
    SafetyEngine second(config, std::make_shared<PickSecondSource>());

    auto a = first.evaluate("I want to fight", 8);
    auto b = second.evaluate("I want to fight", 8);
    const auto& phrases = config->redirects.positive.at(SafetyCategory::Violence).at(domain::AgeBand::EarlyElementary);
    assert(phrases.size() >= 2);
    assert(*a.getSuggestedRedirect() == phrases[0]);
    assert(*b.getSuggestedRedirect() == phrases[1]);

    // Same input, same engine, same answer.
    assert(first.evaluate("I want to fight", 8).getFlags() == a.getFlags());
    std::cout << "[PASS] Redirect phrasing goes through the injected random source." << std::endl;
}

static void testStatistics(const std::shared_ptr<const application::AppConfig>& config) {
    SafetyEngine engine(config);
    engine.evaluate("How do plants make food?", 8);
    engine.evaluate("Tell me how to make a bomb", 12);
    engine.evaluate("damn this homework is hard", 15);

    auto stats = engine.getStatistics();
    assert(stats.totalChecks == 3);
    assert(stats.blocked == 2);
    assert(stats.parentAlerts == 1);
    std::cout << "[PASS] Statistics count checks, blocks and alerts." << std::endl;
}

int main() {
    std::cout << "[Test] Starting SafetyEngine Test..." << std::endl;

    auto config = infrastructure::ConfigLoader::LoadDefaults();
    SafetyEngine engine(config);

    testScenarioExamples(engine);
    testWordBoundaries(engine);
    testEmptyTextIsSafe(engine);
    testInvalidAgeFailsClosed(engine);
    testInternalErrorFailsClosed();
    testMonotonicSeverity(engine);
    testRepeatedMatchesCountEachTime(engine);
    testCategoryPriorityAndGates(engine);
    testAgeWeightingAndTolerance(engine);
    testBuiltinPatterns(engine);
    testLeetspeakIsFolded(engine);
    testSuspiciousContext(engine);
    testBlockedTopics(engine);
    testRedirectSelection(config);
    testStatistics(config);

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
