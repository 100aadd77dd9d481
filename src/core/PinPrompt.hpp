#pragma once

#include <QString>
#include <QTextStream>

namespace tvr {

/// Interactive PIN entries allowed before the CLI gives up.
constexpr int MAX_PIN_ATTEMPTS = 3;

/// Writes the PIN prompt to out and reads one line from in.
/// Returns false once in is exhausted; pin is then left untouched.
bool promptForPin(QTextStream& in, QTextStream& out, QString& pin);

} // namespace tvr
