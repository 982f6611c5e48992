#pragma once

#include <QString>

namespace todo {
namespace core {

// Output capability of the terminal the listing is written to. A palette
// without color returns text unchanged.
class Palette
{
public:
    enum class Color
    {
        Red,
        Green,
    };

    explicit Palette(bool colorEnabled = false);

    bool colorEnabled() const;

    QString paint(const QString &text, Color color) const;
    QString dimmed(const QString &text) const;

private:
    bool m_colorEnabled = false;
};

} // namespace core
} // namespace todo
