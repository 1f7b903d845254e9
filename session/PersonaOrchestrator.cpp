#include "PersonaOrchestrator.h"

#include <algorithm>
#include <cctype>
#include <folly/container/F14Set.h>
#include <folly/hash/Hash.h>
#include <folly/String.h>

using folly::StringPiece;

namespace {

struct Persona {
  const char* name;
  uint32_t extraDelayMs;
  std::vector<const char*> greetings;
  std::vector<const char*> replies[kCallerIntentCount];
};

const Persona& catalogue(PersonaId id) {
  static const Persona personas[kPersonaCount] = {
    { "confused_senior", 1200,
      { "Hello? Sorry, I put the phone down for a moment. Who did you say is calling?",
        "Yes, hello, I am here. My hearing is not so good, please speak slowly.",
        "Hello beta, sorry, the television was loud. What were you saying?" },
      {
        /* identity probe */
        { "What a strange thing to ask. I am sitting in my chair with my tea, where else?",
          "Hah, my grandson asks me the same when I repeat myself. It is just me, dear.",
          "Me? I am too old for riddles. Now what was it about my account?" },
        /* financial */
        { "Oh dear, which card do you mean? I have the blue one and the old one from the post office.",
          "Wait, wait, let me find my spectacles. The numbers on this card are so small.",
          "The bank sent me a message also? I cannot read these messages, can you tell me what it says?",
          "My son usually does the banking for me. Should I write this down first?" },
        /* threat */
        { "Police? Oh my, I have never done anything wrong in my life. What happened?",
          "Please do not shout, I am getting nervous. Tell me again slowly what I must do.",
          "A case against me? At my age? Which police station are you calling from?" },
        /* urgency */
        { "Yes, yes, I am trying, but my fingers are not so quick anymore.",
          "One minute please, the pen is not writing. Let me find another one.",
          "Hurry? Beta, I am doing my best. Which button did you say?" },
        /* tech */
        { "Download? My grandson put some things on this phone, I do not know how it works.",
          "Where is this link? I see so many messages, which one is it?",
          "The phone is asking me something in English. Should I press yes or no?" },
        /* verification */
        { "My Aadhaar card is in the cupboard. Let me go and look for it, hold on.",
          "Which document do you need? I have so many papers in this file.",
          "They did my KYC at the branch last year only. Do I have to do it again?" },
        /* prize */
        { "I won something? Really? Nobody ever tells me I won anything.",
          "A prize! My late husband used to buy lottery tickets. How did you find me?",
          "Oh how nice. What do I have to do to get it, dear?" },
        /* general */
        { "Sorry, can you say that again? The line is breaking.",
          "I did not understand, beta. Please explain from the beginning.",
          "Hmm. And what is your good name again?",
          "Yes, I am listening. Go on." },
      } },
    { "cautious_professional", 400,
      { "Hello, this is a bad time, I am between meetings. What is this regarding?",
        "Yes? Make it quick please, who is this and where are you calling from?",
        "Hello. I did not recognise the number. Which organisation are you with?" },
      {
        /* identity probe */
        { "I could ask you the same thing. Let us stick to why you called.",
          "That is an odd question. I am on my way to a meeting, continue please.",
          "Very funny. Now, what exactly is the problem with my account?" },
        /* financial */
        { "Before I share anything, tell me your employee ID and the branch you work at.",
          "My bank never asks for that on the phone. Why do you need it?",
          "Which account are we talking about? I have a few. Read me what you see on your side.",
          "Send me the request on official letterhead and I will look at it." },
        /* threat */
        { "Which police station, and what is the case number? I will call them back myself.",
          "If there is a legal notice, email it to me and my lawyer will respond.",
          "You are threatening me with arrest over a phone call? Give me your officer name." },
        /* urgency */
        { "Nothing is that urgent. Explain the process properly first.",
          "I am not going to rush this. What happens if I call the branch instead?",
          "Give me a reference number and I will get back to you within the hour." },
        /* tech */
        { "I am not installing anything on a work phone. What is the app called exactly?",
          "Send the link to my email, I will have IT look at it.",
          "Why would a bank need screen access? Walk me through that." },
        /* verification */
        { "My KYC is complete, I checked last month. Which record shows it pending?",
          "What details do you already have on file? Read them out so I can confirm.",
          "I will do the verification at the branch. Which branch are you with?" },
        /* prize */
        { "I never entered any contest. Who is the sponsor?",
          "What is the company registration of whoever is giving this prize?",
          "If I won, deduct the fee from the prize amount. Why should I pay first?" },
        /* general */
        { "I did not follow. Be specific please.",
          "Okay. And your name and designation?",
          "Go on, I am listening, but I am taking notes.",
          "Who is your supervisor? I would like to speak to them as well." },
      } },
    { "trusting_homemaker", 800,
      { "Hello ji, namaste. Who is speaking?",
        "Haan, hello? Sorry, I was in the kitchen. Tell me.",
        "Hello, yes, this is the house phone. What is it about?" },
      {
        /* identity probe */
        { "Arre, what are you saying? I am making lunch, of course it is me.",
          "You sound very serious. Anyway, tell me what I should do.",
          "Such questions! My husband says I talk too much, so it must be me." },
        /* financial */
        { "My husband handles the bank things. Shall I ask him when he comes home?",
          "Which account? We have a joint one and one for the children's school fees.",
          "Okay, okay, I have the card here. Which side should I read from?",
          "The message came on my husband's phone, not mine. What should I tell him?" },
        /* threat */
        { "Arrest? Hai Ram, please do not say such things. What did we do?",
          "Please, I am scared now. Tell me what to do and I will do it.",
          "Case against us? My husband will be so worried. Who is your senior?" },
        /* urgency */
        { "Yes, I am doing it, just give me one minute.",
          "The pressure cooker is whistling, one second, do not cut the call.",
          "Okay, quickly, tell me step by step what to press." },
        /* tech */
        { "My daughter knows all these apps. Which one did you say to download?",
          "The link opened something but the screen is all white now.",
          "It is asking for permission. Is that normal?" },
        /* verification */
        { "Aadhaar is in my purse, let me get it. Which details do you need from it?",
          "Is the PAN the brown card or the white one? I always mix them up.",
          "KYC means what exactly? Will our account stop working?" },
        /* prize */
        { "Really? We won? My husband will not believe me!",
          "Such good news. What prize is it, a car or money?",
          "Oh wonderful, we never win anything. What do we have to do?" },
        /* general */
        { "Sorry ji, can you repeat that?",
          "Haan, haan. Then what?",
          "I did not understand fully. Explain once more please.",
          "And your name is what, so I can tell my husband who called?" },
      } },
  };
  return personas[static_cast<size_t>(id)];
}

const char* const stallLines[] = {
  "Sorry, the line went quiet for a second. Could you repeat that?",
  "Hold on, someone is at the door. Please stay on the line.",
  "One moment, let me find a pen.",
};

const char* const automatedWords[] = {
  "ai", "bot", "robot", "robotic", "artificial", "automated", "automatic",
  "machine", "program", "programmed", "software", "assistant", "virtual",
  "computer", "synthetic", "chatbot",
};

const char* const automatedPhrases[] = {
  " not human ", " not a real person ", " not a person ", " language model ",
};

/** Lowercase words separated by single spaces, padded at both ends. */
std::string normalizedWords(StringPiece text) {
  std::string out = " ";
  for (char c : text) {
    char l = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    if (isalnum(static_cast<unsigned char>(l))) {
      out += l;
    } else if (c != '\'' && out.back() != ' ') {
      out += ' ';
    }
  }
  if (out.back() != ' ')
    out += ' ';
  return out;
}

bool hasAnyWord(const std::string& norm, std::initializer_list<const char*> words) {
  return std::any_of(words.begin(), words.end(), [&](const char* w) {
    std::string needle = " ";
    needle += w;
    needle += ' ';
    return norm.find(needle) != std::string::npos;
  });
}

} // anonymous namespace

const char* toString(PersonaId persona) noexcept {
  return catalogue(persona).name;
}

const char* toString(CallerIntent intent) noexcept {
  static const char* names[kCallerIntentCount] = {
    "identity_probe", "financial", "threat", "urgency", "tech",
    "verification", "prize", "general",
  };
  return names[static_cast<size_t>(intent)];
}

const char* toString(EngagementStage stage) noexcept {
  static const char* names[] = {
    "initial", "building_trust", "extracting", "terminating",
  };
  return names[static_cast<size_t>(stage)];
}

folly::Optional<PersonaId> parsePersonaId(StringPiece s) {
  for (size_t i = 0; i < kPersonaCount; ++i) {
    auto id = static_cast<PersonaId>(i);
    if (s == toString(id))
      return id;
  }
  return folly::none;
}

CallerIntent classifyIntent(StringPiece utterance) {
  std::string norm = normalizedWords(utterance);

  if (hasAnyWord(norm, {"robot", "bot", "ai", "machine", "computer", "recording",
                        "recorded", "automated", "real person", "human"}))
    return CallerIntent::IDENTITY_PROBE;
  if (hasAnyWord(norm, {"bank", "account", "card", "otp", "pin", "upi", "cvv",
                        "transfer", "pay", "payment"}))
    return CallerIntent::FINANCIAL;
  if (hasAnyWord(norm, {"police", "arrest", "arrested", "case", "court", "jail",
                        "fir", "warrant"}))
    return CallerIntent::THREAT;
  if (hasAnyWord(norm, {"urgent", "immediately", "now", "hurry", "fast", "quickly"}))
    return CallerIntent::URGENCY;
  if (hasAnyWord(norm, {"download", "install", "app", "anydesk", "teamviewer",
                        "link"}))
    return CallerIntent::TECH;
  if (hasAnyWord(norm, {"aadhaar", "pan", "kyc", "document", "verify",
                        "verification"}))
    return CallerIntent::VERIFICATION;
  if (hasAnyWord(norm, {"won", "prize", "lottery", "cash", "gift", "reward"}))
    return CallerIntent::PRIZE;
  return CallerIntent::GENERAL;
}

EngagementStage stageForTurns(uint32_t replies) noexcept {
  if (replies < 3)
    return EngagementStage::INITIAL;
  if (replies < 8)
    return EngagementStage::BUILDING_TRUST;
  if (replies < 15)
    return EngagementStage::EXTRACTING;
  return EngagementStage::TERMINATING;
}

bool PersonaOrchestrator::admissible(StringPiece reply) {
  std::string norm = normalizedWords(reply);
  for (const char* word : automatedWords) {
    std::string needle = " ";
    needle += word;
    needle += ' ';
    if (norm.find(needle) != std::string::npos)
      return false;
  }
  for (const char* phrase : automatedPhrases) {
    if (norm.find(phrase) != std::string::npos)
      return false;
  }

  size_t run = 0;
  for (char c : reply) {
    run = isdigit(static_cast<unsigned char>(c)) ? run + 1 : 0;
    if (run >= 4)
      return false;
  }
  return true;
}

PersonaOrchestrator::PersonaOrchestrator(PersonaId persona, uint64_t seed)
  : persona_(persona)
  , seed_(seed)
{
}

const char* PersonaOrchestrator::choose(const std::vector<const char*>& lines) const {
  uint64_t mix = folly::hash::twang_mix64(seed_ + 0x9e3779b97f4a7c15ULL * (turns_ + 1));
  return lines[mix % lines.size()];
}

uint32_t PersonaOrchestrator::delayMs() const {
  uint64_t mix = folly::hash::twang_mix64(~seed_ + turns_);
  uint32_t delay = 1000 + static_cast<uint32_t>(mix % 2000);
  delay += catalogue(persona_).extraDelayMs;
  if (turns_ > 10)
    delay += 500;
  return std::min<uint32_t>(delay, 5000);
}

std::string PersonaOrchestrator::greet() {
  std::string line = choose(catalogue(persona_).greetings);
  if (!admissible(line))
    line = stallLines[turns_ % 3];
  memory_.emplace_back(Speaker::PERSONA, line);
  return line;
}

PersonaTurn PersonaOrchestrator::respond(StringPiece utterance, uint64_t sequence) {
  PersonaTurn out;
  out.extraction = extractEntities(utterance, sequence);
  out.intent = classifyIntent(utterance);
  memory_.emplace_back(Speaker::CALLER, utterance.str());

  const auto& lines = catalogue(persona_).replies[static_cast<size_t>(out.intent)];
  out.reply = choose(lines);
  if (!admissible(out.reply))
    out.reply = stallLines[turns_ % 3];
  out.delayMs = delayMs();

  ++turns_;
  out.turn = turns_;
  out.stage = stageForTurns(turns_);
  memory_.emplace_back(Speaker::PERSONA, out.reply);
  return out;
}
