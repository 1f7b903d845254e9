#include "EntityExtractor.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <folly/portability/GFlags.h>
#include <folly/String.h>
#include <folly/Conv.h>

using folly::StringPiece;

DEFINE_double(entity_min_confidence, 0.3,
              "Drop extracted entities scoring below this confidence");
DEFINE_uint32(entity_context_radius, 50,
              "Characters around a candidate searched for context keywords");

namespace {

struct Candidate {
  EntityType type;
  size_t begin;
  size_t end;
  std::string value;
  double confidence;
  bool verified;
};

struct Token {
  size_t begin;
  size_t end;
  StringPiece raw;
  std::string lower;
};

struct DigitRun {
  size_t begin;
  size_t end;
  std::string digits;
  bool plus = false;
  bool grouped = false;
};

struct Span {
  size_t begin;
  size_t end;
};

inline bool isDigit(char c) { return c >= '0' && c <= '9'; }
inline bool isAlpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}
inline bool isAlnum(char c) { return isDigit(c) || isAlpha(c); }
inline bool isUpper(char c) { return c >= 'A' && c <= 'Z'; }

const std::vector<const char*>& contextKeywords(EntityType type) {
  static const std::vector<const char*> keywords[kEntityTypeCount] = {
    /* payment-handle */ {"upi", "pay", "send", "transfer", "gpay", "phonepe", "paytm"},
    /* phone-number */ {"call", "number", "phone", "mobile", "contact", "whatsapp", "dial"},
    /* bank-account */ {"account", "a/c", "acc no", "bank", "transfer", "deposit"},
    /* national-id */ {"aadhaar", "aadhar", "uid", "identity", "kyc"},
    /* tax-id */ {"pan", "income tax", "tax", "kyc"},
    /* card-number */ {"card", "credit", "debit", "visa", "mastercard", "rupay"},
    /* one-time-code */ {"otp", "code", "pin", "password", "verification", "one time"},
    /* bank-routing-code */ {"ifsc", "branch", "bank", "code"},
    /* person-name */ {"name", "officer", "inspector", "mr", "sir", "madam"},
    /* location */ {"from", "branch", "office", "located", "city", "address"},
    /* monetary-amount */ {"pay", "fee", "amount", "transfer", "send", "fine", "charge", "deposit"},
    /* email */ {"email", "mail", "send", "write"},
  };
  return keywords[static_cast<size_t>(type)];
}

int specificity(EntityType type) {
  static const int rank[kEntityTypeCount] = {
    8, // payment-handle
    6, // phone-number
    3, // bank-account
    8, // national-id
    8, // tax-id
    9, // card-number
    5, // one-time-code
    8, // bank-routing-code
    2, // person-name
    2, // location
    4, // monetary-amount
    7, // email
  };
  return rank[static_cast<size_t>(type)];
}

const char* const upiProviders[] = {
  "ybl", "okaxis", "oksbi", "okhdfcbank", "okicici", "paytm", "upi", "ibl",
  "axl", "apl", "sbi", "hdfcbank", "icici", "kotak", "airtel", "jio",
  "fbl", "yesbank", "axisbank", "freecharge", "payzapp", "okbizaxis",
};

const char* const routingPrefixes[] = {
  "SBIN", "HDFC", "ICIC", "UTIB", "PUNB", "BARB", "CNRB", "KKBK", "IDIB",
  "UBIN", "YESB", "IOBA", "BKID", "INDB",
};

const char* const dateWords[] = {
  "year", "since", "born", "date", "month", "till", "until",
};

const char* const gazetteer[] = {
  "mumbai", "delhi", "bangalore", "bengaluru", "kolkata", "chennai",
  "hyderabad", "pune", "ahmedabad", "jaipur", "lucknow", "noida",
  "gurgaon", "gurugram", "jamtara", "kanpur", "nagpur", "indore",
  "bhopal", "patna", "surat", "kochi", "chandigarh", "mewat",
};

const char* const nameCues[] = {
  "my name is ", "this is officer ", "this is inspector ", "i am officer ",
  "i am inspector ", "this is mr ", "this is mr. ", "speaking with officer ",
};

const char* const nameStopWords[] = {
  "the", "a", "an", "calling", "from", "not", "your", "here", "sir",
  "madam", "and", "speaking", "with", "is", "i", "am",
};

const char* const amountPrefixes[] = { "rs.", "rs", "inr", "\xe2\x82\xb9", "$" };
const char* const amountSuffixes[] = {
  "rupees", "rupee", "rs", "inr", "dollars", "lakh", "lakhs", "crore",
  "crores", "thousand",
};

template<size_t N>
bool oneOf(const char* const (&list)[N], StringPiece s) {
  return std::any_of(std::begin(list), std::end(list),
                     [&](const char* item) { return s == item; });
}

class Scanner {
 public:
  Scanner(StringPiece text, uint64_t sequence);

  Extraction run();

 private:
  void tokenize();
  void scanAddresses(const Token& tok);
  void scanAlnumCodes(const Token& tok);
  void scanAmounts();
  void scanDigitRuns();
  void classifyDigitRun(const DigitRun& run);
  void scanNames();
  void scanLocations();

  int contextHits(EntityType type, size_t begin, size_t end) const;
  void propose(EntityType type, size_t begin, size_t end,
               std::string value, double base, bool verified);
  void reject(EntityType type, size_t begin, size_t end, const char* reason);
  bool insideAmount(size_t begin, size_t end) const;
  template<size_t N>
  bool nearAny(const char* const (&words)[N], size_t begin, size_t end) const;

  StringPiece text_;
  uint64_t sequence_;
  std::string lower_;
  std::vector<Token> tokens_;
  std::vector<Span> amounts_;
  std::vector<Candidate> candidates_;
  std::vector<MalformedEntity> malformed_;
};

Scanner::Scanner(StringPiece text, uint64_t sequence)
  : text_(text)
  , sequence_(sequence)
  , lower_(text.str())
{
  folly::toLowerAscii(lower_);
}

void Scanner::tokenize() {
  static const char* leading = "([{\"'<";
  static const char* trailing = ".,;:!?)]}\"'>";
  size_t i = 0, n = text_.size();

  while (i < n) {
    while (i < n && isspace(static_cast<unsigned char>(text_[i])))
      ++i;
    size_t begin = i;
    while (i < n && !isspace(static_cast<unsigned char>(text_[i])))
      ++i;
    size_t end = i;
    while (begin < end && strchr(leading, text_[begin]))
      ++begin;
    while (end > begin && strchr(trailing, text_[end - 1]))
      --end;
    if (begin < end) {
      tokens_.push_back(Token{begin, end, text_.subpiece(begin, end - begin),
                              lower_.substr(begin, end - begin)});
    }
  }
}

int Scanner::contextHits(EntityType type, size_t begin, size_t end) const {
  size_t radius = FLAGS_entity_context_radius;
  size_t from = begin > radius ? begin - radius : 0;
  size_t to = std::min(lower_.size(), end + radius);
  StringPiece window(lower_.data() + from, to - from);
  int hits = 0;

  for (const char* keyword : contextKeywords(type)) {
    if (window.find(keyword) != StringPiece::npos)
      ++hits;
  }
  return hits;
}

void Scanner::propose(EntityType type, size_t begin, size_t end,
                      std::string value, double base, bool verified)
{
  double confidence = base + std::min(0.3, 0.1 * contextHits(type, begin, end));
  confidence = std::max(0.0, std::min(1.0, confidence));
  if (confidence < FLAGS_entity_min_confidence)
    return;
  candidates_.push_back(Candidate{type, begin, end, std::move(value),
                                  confidence, verified});
}

void Scanner::reject(EntityType type, size_t begin, size_t end,
                     const char* reason)
{
  SourcePosition pos{sequence_, static_cast<uint32_t>(begin),
                     static_cast<uint32_t>(end - begin)};
  malformed_.push_back(MalformedEntity{type, pos, reason});
}

template<size_t N>
bool Scanner::nearAny(const char* const (&words)[N], size_t begin, size_t end) const {
  size_t radius = FLAGS_entity_context_radius;
  size_t from = begin > radius ? begin - radius : 0;
  StringPiece window(lower_.data() + from, std::min(lower_.size(), end + radius) - from);
  return std::any_of(std::begin(words), std::end(words), [&](const char* w) {
    return window.find(w) != StringPiece::npos;
  });
}

bool Scanner::insideAmount(size_t begin, size_t end) const {
  return std::any_of(amounts_.begin(), amounts_.end(), [&](const Span& s) {
    return begin < s.end && s.begin < end;
  });
}

void Scanner::scanAddresses(const Token& tok) {
  size_t at = tok.lower.find('@');
  if (at == std::string::npos || tok.lower.find('@', at + 1) != std::string::npos)
    return;

  StringPiece local(tok.lower.data(), at);
  StringPiece domain(tok.lower.data() + at + 1, tok.lower.size() - at - 1);
  if (local.empty() || domain.empty())
    return;

  auto localChar = [](char c) { return isAlnum(c) || strchr("._-", c); };
  if (!std::all_of(local.begin(), local.end(), localChar))
    return;

  size_t dot = domain.rfind('.');
  if (dot != StringPiece::npos) {
    StringPiece tld = domain.subpiece(dot + 1);
    auto domainChar = [](char c) { return isAlnum(c) || c == '.' || c == '-'; };
    if (dot == 0 || tld.size() < 2 ||
        !std::all_of(tld.begin(), tld.end(), isAlpha) ||
        !std::all_of(domain.begin(), domain.end(), domainChar))
      return;
    propose(EntityType::EMAIL, tok.begin, tok.end, tok.lower, 0.7, true);
    return;
  }

  if (!std::all_of(domain.begin(), domain.end(), isAlpha) || local.size() < 2)
    return;
  bool known = oneOf(upiProviders, domain);
  propose(EntityType::PAYMENT_HANDLE, tok.begin, tok.end, tok.lower,
          known ? 0.85 : 0.6, known);
}

void Scanner::scanAlnumCodes(const Token& tok) {
  StringPiece s = tok.raw;
  if (!std::all_of(s.begin(), s.end(), isAlnum))
    return;

  std::string upper = s.str();
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](char c) { return static_cast<char>(toupper(c)); });

  if (upper.size() == 10) {
    // AAAAA9999A; the fourth letter encodes the holder category
    bool shape = std::all_of(upper.begin(), upper.begin() + 5, isAlpha) &&
                 std::all_of(upper.begin() + 5, upper.begin() + 9, isDigit) &&
                 isAlpha(upper[9]);
    if (!shape)
      return;
    bool holder = strchr("PCHFATBLJG", upper[3]) != nullptr;
    propose(EntityType::TAX_ID, tok.begin, tok.end, upper,
            holder ? 0.7 : 0.5, holder);
  } else if (upper.size() == 11) {
    // AAAA0XXXXXX
    bool shape = std::all_of(upper.begin(), upper.begin() + 4, isAlpha) &&
                 std::any_of(upper.begin() + 4, upper.end(), isDigit);
    if (!shape)
      return;
    if (upper[4] != '0') {
      if (contextHits(EntityType::BANK_ROUTING_CODE, tok.begin, tok.end) > 0)
        reject(EntityType::BANK_ROUTING_CODE, tok.begin, tok.end,
               "fifth character must be zero");
      return;
    }
    bool knownBank = oneOf(routingPrefixes, StringPiece(upper).subpiece(0, 4));
    propose(EntityType::BANK_ROUTING_CODE, tok.begin, tok.end, upper,
            knownBank ? 0.75 : 0.6, true);
  }
}

static bool isAmountNumber(StringPiece s) {
  if (s.empty() || !isDigit(s.front()))
    return false;
  int dots = 0;
  for (char c : s) {
    if (c == '.')
      ++dots;
    else if (!isDigit(c) && c != ',')
      return false;
  }
  return dots <= 1 && s.back() != '.' && s.back() != ',';
}

void Scanner::scanAmounts() {
  for (size_t i = 0; i < tokens_.size(); ++i) {
    const Token& tok = tokens_[i];
    StringPiece lower(tok.lower);

    // Prefix glued to the number: rs.5000, $200
    for (const char* prefix : amountPrefixes) {
      StringPiece rest = lower;
      if (rest.removePrefix(prefix) && isAmountNumber(rest)) {
        amounts_.push_back(Span{tok.begin, tok.end});
        propose(EntityType::MONETARY_AMOUNT, tok.begin, tok.end,
                tok.raw.str(), 0.65, false);
        break;
      }
    }

    if (i + 1 >= tokens_.size())
      continue;
    const Token& next = tokens_[i + 1];
    bool prefixed = oneOf(amountPrefixes, lower) && isAmountNumber(next.lower);
    bool suffixed = isAmountNumber(lower) && oneOf(amountSuffixes, next.lower);
    if (prefixed || suffixed) {
      amounts_.push_back(Span{tok.begin, next.end});
      propose(EntityType::MONETARY_AMOUNT, tok.begin, next.end,
              text_.subpiece(tok.begin, next.end - tok.begin).str(), 0.65, false);
      ++i;
    }
  }
}

void Scanner::scanDigitRuns() {
  size_t i = 0, n = text_.size();

  while (i < n) {
    char c = text_[i];
    if (isAlpha(c)) {
      // Digits glued to letters belong to another token shape
      while (i < n && isAlnum(text_[i]))
        ++i;
      continue;
    }
    if (!isDigit(c)) {
      ++i;
      continue;
    }

    DigitRun run;
    run.plus = i > 0 && text_[i - 1] == '+';
    run.begin = run.plus ? i - 1 : i;
    size_t j = i, groups = 0;

    for (;;) {
      size_t start = j;
      while (j < n && isDigit(text_[j]))
        run.digits += text_[j++];
      size_t len = j - start;
      ++groups;

      if (j + 1 < n && (text_[j] == ' ' || text_[j] == '-') && isDigit(text_[j + 1])) {
        size_t k = j + 1;
        while (k < n && isDigit(text_[k]))
          ++k;
        bool prevOk = len >= 3 || (run.plus && groups == 1 && len >= 2);
        if (prevOk && k - (j + 1) >= 3 && (k == n || !isAlpha(text_[k]))) {
          run.grouped = true;
          ++j;
          continue;
        }
      }
      break;
    }

    run.end = j;
    if (j < n && isAlpha(text_[j])) {
      while (j < n && isAlnum(text_[j]))
        ++j;
    } else if (!insideAmount(run.begin, run.end)) {
      classifyDigitRun(run);
    }
    i = j;
  }
}

void Scanner::classifyDigitRun(const DigitRun& run) {
  const std::string& d = run.digits;
  size_t n = d.size();
  bool allSame = std::all_of(d.begin(), d.end(), [&](char c) { return c == d[0]; });
  double repeatPenalty = allSame ? 0.4 : 0.0;

  if (n >= 13 && n <= 19) {
    if (luhnValid(d)) {
      propose(EntityType::CARD_NUMBER, run.begin, run.end, d,
              0.7 - repeatPenalty, true);
    } else if (contextHits(EntityType::CARD_NUMBER, run.begin, run.end) > 0) {
      reject(EntityType::CARD_NUMBER, run.begin, run.end, "luhn check failed");
    }
  }

  if (n == 12 && !run.plus) {
    if (d[0] >= '2') {
      propose(EntityType::NATIONAL_ID, run.begin, run.end, d,
              (run.grouped ? 0.6 : 0.5) - repeatPenalty, false);
    } else if (contextHits(EntityType::NATIONAL_ID, run.begin, run.end) > 0) {
      reject(EntityType::NATIONAL_ID, run.begin, run.end,
             "cannot start with 0 or 1");
    }
  }

  auto mobileLead = [](char c) { return c >= '6' && c <= '9'; };
  if (n == 10 && mobileLead(d[0])) {
    propose(EntityType::PHONE_NUMBER, run.begin, run.end, "+91" + d,
            0.6 - repeatPenalty, false);
  } else if (n == 12 && d.compare(0, 2, "91") == 0 && mobileLead(d[2])) {
    propose(EntityType::PHONE_NUMBER, run.begin, run.end, "+" + d,
            (run.plus ? 0.75 : 0.5) - repeatPenalty, run.plus);
  } else if (n == 11 && d[0] == '0' && mobileLead(d[1])) {
    propose(EntityType::PHONE_NUMBER, run.begin, run.end, "+91" + d.substr(1),
            0.5 - repeatPenalty, false);
  }

  if (n >= 9 && n <= 18 && !run.plus) {
    bool context = contextHits(EntityType::BANK_ACCOUNT, run.begin, run.end) > 0;
    propose(EntityType::BANK_ACCOUNT, run.begin, run.end, d,
            (context ? 0.35 : 0.1) - repeatPenalty, false);
  }

  if (n >= 4 && n <= 8 && !run.plus && !run.grouped) {
    bool context = contextHits(EntityType::ONE_TIME_CODE, run.begin, run.end) > 0;
    double penalty = 0;
    if (n == 4) {
      int year = folly::to<int>(d);
      if (year >= 1900 && year <= 2099 && nearAny(dateWords, run.begin, run.end))
        penalty = 0.3;
    }
    propose(EntityType::ONE_TIME_CODE, run.begin, run.end, d,
            (context ? 0.35 : 0.1) - penalty, false);
  }
}

void Scanner::scanNames() {
  for (const char* cue : nameCues) {
    size_t cueLen = strlen(cue);
    for (size_t pos = lower_.find(cue); pos != std::string::npos;
         pos = lower_.find(cue, pos + 1)) {
      if (pos > 0 && isAlnum(lower_[pos - 1]))
        continue;

      auto tok = std::find_if(tokens_.begin(), tokens_.end(),
                              [&](const Token& t) { return t.begin >= pos + cueLen; });
      std::vector<const Token*> words;
      bool capitalized = tok != tokens_.end() && isUpper(tok->raw.front());

      for (; tok != tokens_.end() && words.size() < 3; ++tok) {
        if (!std::all_of(tok->raw.begin(), tok->raw.end(), isAlpha))
          break;
        if (oneOf(nameStopWords, tok->lower))
          break;
        if (capitalized != isUpper(tok->raw.front()))
          break;
        words.push_back(&*tok);
        if (!capitalized && words.size() == 2)
          break;
        // Sentence punctuation ends the name
        if (tok->end < text_.size() && strchr(".,;:!?", text_[tok->end]))
          break;
      }
      if (words.empty())
        continue;

      size_t begin = words.front()->begin;
      size_t end = words.back()->end;
      std::string value = text_.subpiece(begin, end - begin).str();
      propose(EntityType::PERSON_NAME, begin, end, std::move(value),
              capitalized ? 0.5 : 0.35, false);
    }
  }
}

void Scanner::scanLocations() {
  for (size_t i = 0; i < tokens_.size(); ++i) {
    const Token& tok = tokens_[i];
    if (tok.lower == "new" && i + 1 < tokens_.size() && tokens_[i + 1].lower == "delhi") {
      const Token& next = tokens_[i + 1];
      propose(EntityType::LOCATION, tok.begin, next.end,
              text_.subpiece(tok.begin, next.end - tok.begin).str(), 0.45, false);
      ++i;
    } else if (oneOf(gazetteer, tok.lower)) {
      propose(EntityType::LOCATION, tok.begin, tok.end, tok.raw.str(), 0.4, false);
    }
  }
}

Extraction Scanner::run() {
  tokenize();
  for (const Token& tok : tokens_) {
    scanAddresses(tok);
    scanAlnumCodes(tok);
  }
  scanAmounts();
  scanDigitRuns();
  scanNames();
  scanLocations();

  std::sort(candidates_.begin(), candidates_.end(),
            [](const Candidate& a, const Candidate& b) {
    if (a.confidence != b.confidence)
      return a.confidence > b.confidence;
    if (specificity(a.type) != specificity(b.type))
      return specificity(a.type) > specificity(b.type);
    return a.begin < b.begin;
  });

  Extraction out;
  std::vector<Span> taken;
  for (Candidate& c : candidates_) {
    bool overlaps = std::any_of(taken.begin(), taken.end(), [&](const Span& s) {
      return c.begin < s.end && s.begin < c.end;
    });
    if (overlaps)
      continue;
    taken.push_back(Span{c.begin, c.end});

    ExtractedEntity entity;
    entity.type = c.type;
    entity.masked = maskEntity(c.type, c.value);
    entity.original = std::move(c.value);
    entity.confidence = c.confidence;
    entity.position = SourcePosition{sequence_, static_cast<uint32_t>(c.begin),
                                     static_cast<uint32_t>(c.end - c.begin)};
    entity.verified = c.verified;
    out.entities.push_back(std::move(entity));
  }

  std::sort(out.entities.begin(), out.entities.end(),
            [](const ExtractedEntity& a, const ExtractedEntity& b) {
    return a.position.offset < b.position.offset;
  });
  out.malformed = std::move(malformed_);
  return out;
}

} // anonymous namespace

Extraction extractEntities(StringPiece text, uint64_t sequence) {
  return Scanner(text, sequence).run();
}

std::string maskEntity(EntityType type, StringPiece value) {
  size_t n = value.size();

  switch (type) {
  case EntityType::NATIONAL_ID:
  case EntityType::CARD_NUMBER:
  case EntityType::ONE_TIME_CODE:
  case EntityType::BANK_ACCOUNT: {
    size_t reveal = std::min<size_t>(4, n / 3);
    std::string masked(n - reveal, 'X');
    masked.append(value.end() - reveal, value.end());
    return masked;
  }
  case EntityType::TAX_ID:
    if (n <= 4)
      return std::string(n, 'X');
    return value.subpiece(0, 2).str() + std::string(n - 4, 'X') +
           value.subpiece(n - 2).str();
  default:
    return value.str();
  }
}

bool luhnValid(StringPiece digits) noexcept {
  if (digits.empty())
    return false;

  int sum = 0;
  bool twice = false;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    if (!isDigit(*it))
      return false;
    int d = *it - '0';
    if (twice) {
      d *= 2;
      if (d > 9)
        d -= 9;
    }
    sum += d;
    twice = !twice;
  }
  return sum % 10 == 0;
}

GuardError toError(const MalformedEntity& bad) {
  GuardError err = GUARD_MALFORMED_ENTITY;
  err.putVariable(toString(bad.type));
  err.putVariable(folly::to<std::string>(bad.position.sequence, ':',
                                         bad.position.offset));
  err.putVariable(bad.reason);
  return err;
}
