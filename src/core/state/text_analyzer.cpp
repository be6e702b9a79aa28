#include "core/state/text_analyzer.h"

#include <QRegularExpression>

#include <algorithm>
#include <cstddef>

namespace rt {

namespace {

constexpr const char* kEmailKeywords[] = {"dear", "sincerely"};
constexpr const char* kAcademicKeywords[] = {"chapter", "section", "figure", "table", "reference"};
constexpr const char* kNewsKeywords[] = {"breaking", "reported", "according to", "sources"};

constexpr const char* kPositiveCommands[] = {"continue", "faster", "slower", "repeat", "explain", "more"};
constexpr const char* kNegativeCommands[] = {"stop", "pause", "skip", "enough", "quit"};

constexpr const char* kConfusionCommands[] = {"explain", "what", "why", "how", "repeat", "clarify", "confused"};
constexpr const char* kConfidenceCommands[] = {"got it", "understand", "clear", "makes sense", "continue"};

constexpr double kNeutralSignal = 0.5;
constexpr int kCommandSaturation = 10;

QStringList splitWords(const QString& text)
{
    static const QRegularExpression kWhitespace(QStringLiteral("\\s+"));
    return text.split(kWhitespace, Qt::SkipEmptyParts);
}

template <size_t N>
bool containsAny(const QString& haystackLower, const char* const (&needles)[N])
{
    for (const char* needle : needles) {
        if (haystackLower.contains(QLatin1String(needle))) {
            return true;
        }
    }
    return false;
}

template <size_t N>
int countMatching(const QStringList& commands, const char* const (&family)[N])
{
    int count = 0;
    for (const QString& command : commands) {
        if (containsAny(command.toLower(), family)) {
            ++count;
        }
    }
    return count;
}

double ratioOrNeutral(int hits, int misses)
{
    const int total = hits + misses;
    if (total == 0) {
        return kNeutralSignal;
    }
    return static_cast<double>(hits) / static_cast<double>(total);
}

} // namespace

double TextAnalyzer::difficulty(const QString& text)
{
    const QStringList words = splitWords(text);
    if (words.isEmpty()) {
        return 0.0;
    }

    qint64 totalLetters = 0;
    for (const QString& word : words) {
        totalLetters += word.size();
    }
    const double avgWordLength = static_cast<double>(totalLetters) / words.size();

    const int sentenceCount = text.count(QChar('.')) + text.count(QChar('!')) + text.count(QChar('?'));
    const double avgSentenceLength = static_cast<double>(words.size()) / std::max(sentenceCount, 1);

    return std::min(1.0, (avgWordLength / 10.0 + avgSentenceLength / 20.0) / 2.0);
}

double TextAnalyzer::normalizedLength(const QString& text)
{
    return std::min(1.0, splitWords(text).size() / 1000.0);
}

double TextAnalyzer::textType(const QString& text)
{
    const QString lower = text.toLower();

    if (text.contains(QChar('@')) || containsAny(lower, kEmailKeywords)) {
        return kEmailType;
    }
    if (containsAny(lower, kAcademicKeywords)) {
        return kAcademicType;
    }
    if (containsAny(lower, kNewsKeywords)) {
        return kNewsType;
    }
    return kGeneralType;
}

double TextAnalyzer::engagementFromCommands(const QStringList& commands)
{
    if (commands.isEmpty()) {
        return kNeutralSignal;
    }
    return ratioOrNeutral(countMatching(commands, kPositiveCommands),
                          countMatching(commands, kNegativeCommands));
}

double TextAnalyzer::comprehensionFromCommands(const QStringList& commands)
{
    if (commands.isEmpty()) {
        return kNeutralSignal;
    }
    // Confident commands count towards comprehension, confused ones against.
    return ratioOrNeutral(countMatching(commands, kConfidenceCommands),
                          countMatching(commands, kConfusionCommands));
}

double TextAnalyzer::encodeRecentCommands(const QStringList& commands)
{
    return std::min(1.0, static_cast<double>(commands.size()) / kCommandSaturation);
}

} // namespace rt
