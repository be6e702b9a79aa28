#pragma once

#include <QString>
#include <QStringList>

namespace rt {

// Pure heuristics over raw text and listener commands. All results are in
// [0, 1]; none of them touch shared state.
class TextAnalyzer {
public:
    static constexpr double kEmailType = 0.1;
    static constexpr double kGeneralType = 0.4;
    static constexpr double kNewsType = 0.6;
    static constexpr double kAcademicType = 0.8;

    // Mean word length and words per sentence, folded into one score.
    static double difficulty(const QString& text);
    static double normalizedLength(const QString& text);

    // Keyword families are checked in order email, academic, news; the first
    // family with a hit decides the type.
    static double textType(const QString& text);

    static double engagementFromCommands(const QStringList& commands);
    static double comprehensionFromCommands(const QStringList& commands);
    static double encodeRecentCommands(const QStringList& commands);
};

} // namespace rt
