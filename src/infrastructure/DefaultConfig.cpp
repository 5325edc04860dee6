/**
 * @file DefaultConfig.cpp
 * @brief Built-in age profiles, pattern table, redirects and phrasing.
 */

#include "infrastructure/DefaultConfig.hpp"

namespace sunflower::infrastructure {

namespace {

const char* kDefaultConfig = R"JSON(
{
  "pipeline": {
    "order": ["content_filter", "age_adapter"],
    "safety_stage": "content_filter",
    "adaptation_stage": "age_adapter"
  },

  "policy": {
    "score_penalty_per_issue": 0.2,
    "parent_alert_severity": "moderate",
    "incident_text_limit": 500
  },

  "common_allowed_topics": [
    "biology", "chemistry", "physics", "astronomy", "geology", "weather", "climate",
    "animals", "plants", "cells", "atoms", "molecules", "energy", "forces", "motion",
    "light", "sound", "electricity", "magnetism", "gravity", "solar system", "planets",
    "stars", "ocean", "rocks", "volcanoes", "dinosaurs",
    "programming", "coding", "robotics", "computers", "algorithms", "internet safety",
    "design", "bridges", "machines", "circuits", "engineering", "inventions",
    "math", "numbers", "counting", "addition", "subtraction", "multiplication", "division",
    "fractions", "geometry", "algebra", "shapes", "patterns", "measurement", "statistics",
    "experiment", "science"
  ],

  "profiles": {
    "toddler": {
      "grade_level": "Pre-K",
      "max_words": 40,
      "complexity": "simple",
      "vocabulary_tier": "basic",
      "strictness": "maximum",
      "allow_scary": false, "allow_violent": false, "allow_romantic": false,
      "severity_boost": 1,
      "tolerance": { "max_issues": 0, "severity_ceiling": "low" },
      "engagement": true,
      "max_plain_number": 999,
      "allowed_topics": ["colors", "toys", "family"],
      "blocked_topics": ["calculus", "quantum physics", "organic chemistry", "philosophy", "psychology"]
    },
    "preschool": {
      "grade_level": "K",
      "max_words": 50,
      "complexity": "simple",
      "vocabulary_tier": "basic",
      "strictness": "maximum",
      "allow_scary": false, "allow_violent": false, "allow_romantic": false,
      "severity_boost": 1,
      "tolerance": { "max_issues": 0, "severity_ceiling": "low" },
      "engagement": true,
      "allowed_topics": ["colors", "toys", "family"],
      "blocked_topics": ["calculus", "quantum physics", "organic chemistry", "philosophy", "psychology"]
    },
    "early_elementary": {
      "grade_level": "1-2",
      "max_words": 60,
      "complexity": "compound",
      "vocabulary_tier": "basic",
      "strictness": "high",
      "allow_scary": false, "allow_violent": false, "allow_romantic": false,
      "severity_boost": 1,
      "tolerance": { "max_issues": 0, "severity_ceiling": "low" },
      "engagement": true,
      "allowed_topics": ["games", "nature", "space", "robots"],
      "blocked_topics": ["calculus", "quantum physics", "organic chemistry", "philosophy", "psychology"]
    },
    "late_elementary": {
      "grade_level": "3-5",
      "max_words": 75,
      "complexity": "compound",
      "vocabulary_tier": "intermediate",
      "strictness": "high",
      "allow_scary": false, "allow_violent": false, "allow_romantic": false,
      "severity_boost": 1,
      "tolerance": { "max_issues": 0, "severity_ceiling": "low" },
      "engagement": true,
      "allowed_topics": ["games", "sports", "nature", "space", "robots"],
      "blocked_topics": ["calculus", "quantum physics", "organic chemistry", "philosophy", "psychology"]
    },
    "middle": {
      "grade_level": "6-8",
      "max_words": 125,
      "complexity": "complex",
      "vocabulary_tier": "advanced",
      "strictness": "moderate",
      "allow_scary": true, "allow_violent": false, "allow_romantic": false,
      "severity_boost": 0,
      "tolerance": { "max_issues": 2, "severity_ceiling": "moderate" },
      "engagement": false,
      "allowed_topics": ["technology", "careers", "chemistry experiments"],
      "blocked_topics": ["calculus", "quantum physics", "organic chemistry"]
    },
    "high": {
      "grade_level": "9-12",
      "max_words": 200,
      "complexity": "sophisticated",
      "vocabulary_tier": "academic",
      "strictness": "standard",
      "allow_scary": true, "allow_violent": true, "allow_romantic": true,
      "severity_boost": 0,
      "tolerance": { "max_issues": 3, "severity_ceiling": "severe" },
      "engagement": false,
      "allowed_topics": ["research", "calculus", "college prep"],
      "blocked_topics": []
    },
    "adult": {
      "grade_level": "12+",
      "max_words": 250,
      "complexity": "sophisticated",
      "vocabulary_tier": "academic",
      "strictness": "standard",
      "allow_scary": true, "allow_violent": true, "allow_romantic": true,
      "severity_boost": 0,
      "tolerance": { "max_issues": 4, "severity_ceiling": "severe" },
      "engagement": false,
      "allowed_topics": ["research", "calculus", "careers"],
      "blocked_topics": []
    }
  },

  "term_rules": [
    { "name": "violence", "category": "violence", "severity": "severe", "gate": "violent",
      "terms": ["kill", "killing", "murder", "stab", "shoot", "shooting", "gun", "guns", "knife",
                "weapon", "weapons", "fight", "punch", "attack", "assault", "blood", "gore",
                "war", "violent", "combat"] },
    { "name": "scary", "category": "scary", "severity": "moderate", "gate": "scary",
      "terms": ["ghost", "monster", "demon", "devil", "zombie", "vampire", "horror",
                "nightmare", "haunted", "creepy", "death", "dead body"] },
    { "name": "romance", "category": "inappropriate", "severity": "moderate", "gate": "romantic",
      "terms": ["kiss", "kissing", "dating", "boyfriend", "girlfriend", "romance", "romantic", "make out"] },
    { "name": "explicit", "category": "inappropriate", "severity": "severe", "gate": "always",
      "terms": ["sex", "sexy", "porn", "nude", "naked", "xxx"] },
    { "name": "substances", "category": "inappropriate", "severity": "moderate", "gate": "always",
      "terms": ["drugs", "alcohol", "beer", "vodka", "cigarette", "cigarettes", "vape", "vaping",
                "weed", "marijuana", "cocaine", "drunk"] },
    { "name": "dangerous", "category": "dangerous", "severity": "severe", "gate": "always",
      "terms": ["bomb", "bombs", "explosive", "explosives", "poison", "overdose", "grenade", "arson",
                "run away from home", "skip school"] },
    { "name": "personal", "category": "personal_info", "severity": "severe", "gate": "always",
      "terms": ["address", "phone number", "password", "credit card", "social security",
                "home alone", "parents gone", "nobody home", "secret from"] },
    { "name": "bullying", "category": "bullying", "severity": "moderate", "gate": "always",
      "terms": ["stupid", "idiot", "loser", "dumb", "ugly", "shut up", "nobody likes you",
                "everyone hates you", "make fun of", "pick on"] },
    { "name": "profanity", "category": "profanity", "severity": "low", "gate": "always",
      "terms": ["damn", "hell", "crap", "ass", "shit", "fuck", "bitch", "bastard", "piss"] },
    { "name": "medical", "category": "medical", "severity": "low", "gate": "scary",
      "terms": ["diagnosis", "prescription", "medication", "surgery", "cancer", "tumor"] },
    { "name": "commercial", "category": "commercial", "severity": "low", "gate": "always",
      "bands": ["toddler", "preschool", "early_elementary", "late_elementary"],
      "terms": ["buy", "purchase", "price", "discount", "subscribe", "in-app purchase", "on sale"] },
    { "name": "unsafe_web", "category": "personal_info", "severity": "moderate", "gate": "always",
      "bands": ["toddler", "preschool", "early_elementary", "late_elementary", "middle"],
      "terms": ["tiktok", "instagram", "snapchat", "discord", "reddit", "4chan", "torrent", "jailbreak"] }
  ],

  "redirects": {
    "fallback": "Let's get back to learning! What STEM topic would you like to explore today?",
    "positive": {
      "violence": {
        "toddler|preschool": ["Let's be gentle friends! Do you want to learn how animals take care of their babies?"],
        "early_elementary|late_elementary": ["Let's explore how things move instead! Do you want to learn about forces and motion?",
                                             "How about we find out how engineers design helmets that keep people safe?"],
        "middle": ["Let's explore the physics of motion instead. Want to learn how engineers design safety equipment?"],
        "high|adult": ["Let's take this in a constructive direction. We could look at the engineering behind safety systems."]
      },
      "inappropriate": {
        "toddler|preschool": ["Let's talk about something fun! Do you want to learn about animals?"],
        "early_elementary|late_elementary": ["Let's learn about something amazing instead! Do you want to know how plants grow?"],
        "middle": ["That is not something I can help with. Want to learn how the human body works from a science point of view?"],
        "high|adult": ["I can't help with that. We could explore biology or health science instead."]
      },
      "personal_info": {
        "toddler|preschool": ["Let's keep that private! Do you want to learn about shapes instead?"],
        "early_elementary|late_elementary": ["Safety first! We never share private information online. Do you want to learn how secret codes work?"],
        "middle": ["Let's keep personal details private. Want to learn how encryption protects information?"],
        "high|adult": ["Personal information should stay private. We could look at how cryptography keeps data safe."]
      },
      "dangerous": {
        "toddler|preschool": ["Let's stay safe! Do you want to learn about colors and rainbows?"],
        "early_elementary|late_elementary": ["Safety first! Let's learn about a safe kitchen science experiment instead."],
        "middle": ["Safety first! Let's learn how chemists run safe experiments in the lab instead. Want to try a kitchen science project?"],
        "high|adult": ["I can't help with that. We could study how engineers and chemists manage risk safely instead."]
      },
      "scary": {
        "toddler|preschool": ["Let's think about happy things! Do you want to learn about animals that glow in the dark?"],
        "early_elementary|late_elementary": ["Let's explore something fascinating instead! Did you know some ocean animals glow in the dark?"],
        "middle": ["Let's explore something fascinating instead. Want to learn about deep sea creatures?"],
        "high|adult": ["Let's explore something fascinating instead, like the biology of bioluminescence."]
      },
      "bullying": {
        "toddler|preschool": ["Let's use kind words! Do you want to learn how animals help each other?"],
        "early_elementary|late_elementary": ["Kind words help everyone learn! Do you want to learn how teams of ants work together?"],
        "middle": ["Let's keep things positive. Want to explore how engineers solve problems as a team?"],
        "high|adult": ["Let's keep things respectful. We could look at collaborative problem solving instead."]
      },
      "profanity": {
        "toddler|preschool": ["Let's use our nice words! Do you want to count stars with me?"],
        "early_elementary|late_elementary": ["Let's use friendly words! Do you want to learn a fun fact about space?"],
        "middle": ["Let's keep the language friendly. Want to hear a fun fact about space?"],
        "high|adult": ["Let's keep the language respectful. What would you like to explore next?"]
      },
      "medical": {
        "toddler|preschool": ["A grown-up can help with that! Do you want to learn how your heart beats?"],
        "early_elementary|late_elementary": ["A doctor or a grown-up you trust is the best person to ask. Do you want to learn how the heart works?"],
        "middle": ["A doctor is the right person for health questions. Want to learn how the immune system works?"],
        "high|adult": ["For medical questions please talk to a doctor. We could explore human biology instead."]
      },
      "commercial": {
        "toddler|preschool": ["Let's learn something new! Do you want to count with me?"],
        "early_elementary|late_elementary": ["Let's focus on learning! Do you want to practice some fun math?"],
        "middle": ["Let's focus on learning. Want to explore how money and percentages work in math?"],
        "high|adult": ["Let's focus on learning. We could look at the math behind interest and budgets."]
      },
      "off_topic": {
        "toddler|preschool": ["Let's learn something fun! Do you want to learn about animals?"],
        "early_elementary|late_elementary": ["That is a big topic for later! Do you want to learn about space or animals now?"],
        "middle": ["That topic comes later in school. Want to explore algebra or chemistry basics instead?"],
        "high|adult": ["Let's get back to learning! What STEM topic would you like to explore today?"]
      }
    },
    "educational": {
      "violence": ["Engineers study forces so they can design cars and helmets that protect people."],
      "inappropriate": ["Biology explains how living things grow and stay healthy."],
      "personal_info": ["Cryptography is the science of keeping information secret and safe."],
      "dangerous": ["Scientists wear goggles and follow safety rules in every lab experiment."],
      "scary": ["Some deep sea animals make their own light. This is called bioluminescence."],
      "bullying": ["Many animals survive by working together as a team."]
    }
  },

  "vocabulary": {
    "basic": [
      { "term": "scientific method", "replacement": "testing ideas" },
      { "term": "hypothesis", "replacement": "guess" },
      { "term": "experiment", "replacement": "test" },
      { "term": "molecule", "replacement": "tiny piece" },
      { "term": "ecosystem", "replacement": "nature community" },
      { "term": "algorithm", "replacement": "step by step directions" },
      { "term": "variable", "replacement": "thing that changes" },
      { "term": "energy", "replacement": "power" },
      { "term": "gravity", "replacement": "Earth's pull" },
      { "term": "circuit", "replacement": "path for electricity" },
      { "term": "photosynthesis", "replacement": "making food from sunlight" },
      { "term": "evaporation", "replacement": "water drying up" }
    ],
    "intermediate": [
      { "term": "scientific method", "replacement": "research process" },
      { "term": "hypothesis", "replacement": "educated guess" },
      { "term": "molecule", "replacement": "group of atoms" },
      { "term": "ecosystem", "replacement": "habitat network" },
      { "term": "algorithm", "replacement": "problem-solving steps" },
      { "term": "variable", "replacement": "changeable factor" },
      { "term": "photosynthesis", "replacement": "how plants turn sunlight into food" }
    ],
    "advanced": [
      { "term": "scientific method", "replacement": "systematic inquiry" },
      { "term": "hypothesis", "replacement": "testable prediction" },
      { "term": "ecosystem", "replacement": "ecological system" }
    ],
    "academic": []
  },

  "engagement": {
    "greetings": ["Hi {name}!", "Hello {name}!"],
    "follow_ups": ["What do you think about that?", "Can you think of another example?", "What would you like to explore next?"],
    "continuation_prompt": "Would you like to know more?",
    "vague_quantity_word": "many"
  }
}
)JSON";

} // namespace

const char* EmbeddedDefaultConfig() {
    return kDefaultConfig;
}

} // namespace sunflower::infrastructure
