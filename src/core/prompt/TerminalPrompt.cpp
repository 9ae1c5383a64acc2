#include "TerminalPrompt.hpp"
#include <termios.h>
#include <unistd.h>
#include <iostream>
#include <string>

namespace tas {

bool TerminalPrompt::askConfirmation(const QString& prompt)
{
    std::cout << prompt.toStdString() << " (y/n) " << std::flush;

    const QString reply = ::isatty(STDIN_FILENO) ? readKey() : readLine();
    std::cout << std::endl;
    return isAffirmative(reply);
}

QString TerminalPrompt::readKey()
{
    termios saved{};
    if (::tcgetattr(STDIN_FILENO, &saved) != 0)
        return readLine();

    termios raw = saved;
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0)
        return readLine();

    char c = 0;
    const ssize_t n = ::read(STDIN_FILENO, &c, 1);
    ::tcsetattr(STDIN_FILENO, TCSANOW, &saved);

    if (n != 1)
        return {};
    return QString(QLatin1Char(c));
}

QString TerminalPrompt::readLine()
{
    std::string line;
    if (!std::getline(std::cin, line))
        return {};
    return QString::fromStdString(line).trimmed();
}

} // namespace tas
