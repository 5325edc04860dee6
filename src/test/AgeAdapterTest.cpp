#undef NDEBUG // Assertions must stay active in every build type.
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/AgeAdapter.hpp"
#include "application/TextUtils.hpp"
#include "domain/AgeClassifier.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace sunflower;
using application::AgeAdapter;
using application::TextUtils;
using domain::AgeBand;
using domain::SentenceComplexity;
using domain::VocabularyTier;

static void testVocabularySubstitution(const AgeAdapter& adapter) {
    assert(adapter.substituteVocabulary("My hypothesis is right.", VocabularyTier::Basic) == "My guess is right.");
    assert(adapter.substituteVocabulary("Hypothesis first.", VocabularyTier::Basic) == "Guess first.");
    assert(adapter.substituteVocabulary("A HYPOTHESIS!", VocabularyTier::Basic) == "A GUESS!");
    assert(adapter.substituteVocabulary("We use the scientific method.", VocabularyTier::Basic) ==
           "We use the testing ideas.");
    assert(adapter.substituteVocabulary("Photosynthesis matters.", VocabularyTier::Intermediate) ==
           "How plants turn sunlight into food matters.");
    assert(adapter.substituteVocabulary("Photosynthesis matters.", VocabularyTier::Academic) ==
           "Photosynthesis matters.");

    // Whole words only.
    assert(adapter.substituteVocabulary("Several hypotheses exist.", VocabularyTier::Basic) ==
           "Several hypotheses exist.");
    std::cout << "[PASS] Vocabulary substitution keeps case and word boundaries." << std::endl;
}

static void testRestructure(const AgeAdapter& adapter) {
    assert(adapter.restructure("Plants need water, and they need sun.", SentenceComplexity::Simple) ==
           "Plants need water. They need sun.");
    assert(adapter.restructure("Fish swim and birds fly!", SentenceComplexity::Simple) ==
           "Fish swim. Birds fly!");
    assert(adapter.restructure("Plants need water.", SentenceComplexity::Simple) == "Plants need water.");

    const std::string chain = "The sun is hot, it gives us light, plants use that light, we eat the plants.";
    assert(adapter.restructure(chain, SentenceComplexity::Compound) ==
           "The sun is hot, it gives us light. Plants use that light, we eat the plants.");
    assert(adapter.restructure(chain, SentenceComplexity::Complex) == chain);
    assert(adapter.restructure(chain, SentenceComplexity::Sophisticated) == chain);
    std::cout << "[PASS] Sentences are split to the band's clause limit." << std::endl;
}

static void testLengthEnforcement(const AgeAdapter& adapter, const domain::AgeProfile& toddler) {
    // Toddler: 40 words, 7 reserved for the longest follow-up, 6-word continuation prompt.
    std::string sentences;
    for (int i = 0; i < 8; ++i) {
        if (!sentences.empty()) sentences += " ";
        sentences += "One two three four five.";
    }
    std::string kept = adapter.enforceLength(sentences, toddler, "");
    assert(TextUtils::CountWords(kept) == 30);
    assert(kept.back() == '.');

    std::string runOn;
    for (int i = 1; i <= 50; ++i) {
        if (!runOn.empty()) runOn += " ";
        runOn += "w" + std::to_string(i);
    }
    std::string cut = adapter.enforceLength(runOn, toddler, "");
    assert(TextUtils::CountWords(cut) == 33);
    assert(cut.find("w27... Would you like to know more?") != std::string::npos);
    assert(cut.find("w28") == std::string::npos);

    std::string shortText = "Plants need water.";
    assert(adapter.enforceLength(shortText, toddler, "") == shortText);
    std::cout << "[PASS] Length limits keep whole sentences or add a continuation prompt." << std::endl;
}

static void testEngagement(const AgeAdapter& adapter,
                           const domain::AgeProfile& toddler,
                           const domain::AgeProfile& middle) {
    assert(adapter.injectEngagement("Plants drink water.", toddler, "Mia") ==
           "Hi Mia! Plants drink water. What do you think about that?");
    assert(adapter.injectEngagement("Mia likes plants.", toddler, "Mia") ==
           "Mia likes plants. What do you think about that?");
    assert(adapter.injectEngagement("Do plants drink water?", toddler, "Mia") ==
           "Hi Mia! Do plants drink water?");
    assert(adapter.injectEngagement("Plants drink water.", toddler, "") ==
           "Plants drink water. What do you think about that?");
    assert(adapter.injectEngagement("Plants drink water.", middle, "Mia") == "Plants drink water.");
    assert(adapter.injectEngagement("Plants are green,", toddler, "Sam") ==
           "Hi Sam! Plants are green. What do you think about that?");
    assert(adapter.injectEngagement("We orbit the Sun", toddler, "") ==
           "We orbit the Sun. What do you think about that?");
    std::cout << "[PASS] Greeting and follow-up are added only where missing." << std::endl;
}

static void testScrub(const AgeAdapter& adapter,
                      const domain::AgeProfile& toddler,
                      const domain::AgeProfile& middle) {
    std::string in = "Visit https://example.com/page. Email me at kid@example.com or call 555-123-4567. "
                     "There are 1000000 stars and 12 moons.";
    assert(adapter.scrub(in, toddler) ==
           "Visit [link-removed]. Email me at [email-removed] or call [phone-removed]. "
           "There are many stars and 12 moons.");

    assert(adapter.scrub("Earth has 1,000,000 bugs.", toddler) == "Earth has many bugs.");
    assert(adapter.scrub("Pi is about 3.14 and I am in 5th grade.", toddler) ==
           "Pi is about 3.14 and I am in 5th grade.");
    assert(adapter.scrub("The ship is 5000 km away.", middle) == "The ship is 5000 km away.");
    assert(adapter.scrub("Go to www.plants.org now.", middle) == "Go to [link-removed] now.");
    std::cout << "[PASS] Links, contacts and large numbers are scrubbed." << std::endl;
}

static void testIdempotenceAndLimits(const AgeAdapter& adapter, const application::AppConfig& config) {
    std::string longText;
    for (int i = 0; i < 30; ++i) {
        longText += "The hypothesis about energy is simple, and plants need water and light to grow. ";
    }
    const std::vector<std::string> texts = {
        "Plants need water, and they need sun.",
        "The hypothesis is simple, and plants need water and sunlight to grow. Visit www.plants.org for 5000 facts.",
        "An ecosystem is a community of living things; the algorithm sorts numbers, but gravity pulls us down.",
        longText,
        "Plants are green,",
        "Plants need water, and they need the Sun",
        "The Sun is hot;",
    };
    const std::vector<std::string> names = {"", "Mia", "Sam"};

    for (AgeBand band : domain::kAllAgeBands) {
        const domain::AgeProfile& profile = config.profileFor(band);
        for (const auto& text : texts) {
            for (const auto& name : names) {
                std::string once = adapter.adapt(text, band, name);
                std::string twice = adapter.adapt(once, band, name);
                if (once != twice) {
                    std::cerr << "[FAIL] Not idempotent for band " << domain::BandToString(band)
                              << ":\n  " << once << "\n  " << twice << std::endl;
                }
                assert(once == twice);
                assert(TextUtils::CountWords(once) <= static_cast<std::size_t>(profile.maxWordCount));
                assert(adapter.adapt(text, band, name) == once);
            }
        }
    }
    std::cout << "[PASS] Adaptation is idempotent, deterministic and within limits." << std::endl;
}

static void testPlantsScenario(const AgeAdapter& adapter) {
    const std::string draft =
        "Photosynthesis is how plants make food from sunlight, and it happens in the leaves, "
        "which are green because of chlorophyll. The plant takes in carbon dioxide, it pulls water "
        "up from the roots, and it releases oxygen that we breathe.";
    std::string out = adapter.adapt(draft, domain::AgeClassifier::Classify(7), "Sam");
    assert(out.rfind("Hi Sam!", 0) == 0);
    assert(TextUtils::CountWords(out) <= 60);
    assert(out.find("Photosynthesis") == std::string::npos);
    assert(out.find("Making food from sunlight") != std::string::npos);
    assert(out.back() == '?');
    assert(adapter.adapt("", AgeBand::Toddler, "Sam").empty());
    std::cout << "[PASS] Early elementary answer is greeted, simplified and bounded." << std::endl;
}

int main() {
    std::cout << "[Test] Starting AgeAdapter Test..." << std::endl;

    auto config = infrastructure::ConfigLoader::LoadDefaults();
    AgeAdapter adapter(config);
    const auto& toddler = config->profileFor(AgeBand::Toddler);
    const auto& middle = config->profileFor(AgeBand::Middle);

    testVocabularySubstitution(adapter);
    testRestructure(adapter);
    testLengthEnforcement(adapter, toddler);
    testEngagement(adapter, toddler, middle);
    testScrub(adapter, toddler, middle);
    testIdempotenceAndLimits(adapter, *config);
    testPlantsScenario(adapter);

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
