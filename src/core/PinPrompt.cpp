#include "core/PinPrompt.hpp"

namespace tvr {

bool promptForPin(QTextStream& in, QTextStream& out, QString& pin)
{
    out << "Enter PIN shown on the TV: " << Qt::flush;
    const QString line = in.readLine();
    if (line.isNull())
        return false;
    pin = line.trimmed();
    return true;
}

} // namespace tvr
