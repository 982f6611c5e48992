#include "todo/core/Palette.hpp"

namespace todo {
namespace core {

namespace {
constexpr auto RED = "\033[31m";
constexpr auto GREEN = "\033[32m";
constexpr auto DIM = "\033[2m";
constexpr auto RESET = "\033[0m";

QString wrap(const char *code, const QString &text)
{
    return QLatin1String(code) + text + QLatin1String(RESET);
}
} // namespace

Palette::Palette(bool colorEnabled)
    : m_colorEnabled(colorEnabled)
{
}

bool Palette::colorEnabled() const
{
    return m_colorEnabled;
}

QString Palette::paint(const QString &text, Color color) const
{
    if (!m_colorEnabled) {
        return text;
    }
    switch (color) {
    case Color::Green:
        return wrap(GREEN, text);
    case Color::Red:
        return wrap(RED, text);
    }
    return text;
}

QString Palette::dimmed(const QString &text) const
{
    if (!m_colorEnabled) {
        return text;
    }
    return wrap(DIM, text);
}

} // namespace core
} // namespace todo
