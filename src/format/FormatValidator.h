#pragma once
#include "format/FormatDescriptor.h"
#include <QtCore/QByteArray>
#include <QtCore/QJsonObject>
namespace dsc {
struct ConfigError {
    QStringList violations;
    QString toString() const { return violations.join(QStringLiteral("; ")); }
};

// Builds a FormatDescriptor from a packet configuration document. Every
// violation is collected; on failure `out` is left untouched.
class FormatValidator {
public:
    static bool parse(const QJsonObject& document, FormatDescriptor& out, ConfigError& error);
    static bool parse(const QByteArray& json, FormatDescriptor& out, ConfigError& error);
    static constexpr int kMaxFieldBytes = 8;
    static constexpr int kMaxFieldBits = 64;
};
}
