#pragma once

#include <QString>
#include <QColor>

class QWidget;

/**
 * @brief Application themes and style helpers.
 */
namespace Style {

    /**
     * @brief Creates and applies a QGraphicsDropShadowEffect to a given widget.
     */
    void applyShadowEffect(QWidget* widget,
                           const QColor& color = QColor("#000000"),
                           int radius = 10,
                           int x_offset = 0,
                           int y_offset = 4);

    /**
     * @brief Stylesheet of a theme name ("dark" or "light"); dark for anything else.
     */
    const QString& themeStyleSheet(const QString& theme);

    // --- THEME DEFINITIONS ---
    extern const QString DARK_ACCENT_COLOR;
    extern const QString DARK_ACCENT_HOVER;
    extern const QString DARK_ACCENT_PRESSED;
    extern const QString DARK_BG;
    extern const QString DARK_SECONDARY_BG;
    extern const QString DARK_TEXT;
    extern const QString DARK_MUTED_TEXT;
    extern const QString DARK_BORDER;

    extern const QString LIGHT_ACCENT_COLOR;
    extern const QString LIGHT_ACCENT_HOVER;
    extern const QString LIGHT_ACCENT_PRESSED;
    extern const QString LIGHT_BG;
    extern const QString LIGHT_SECONDARY_BG;
    extern const QString LIGHT_TEXT;
    extern const QString LIGHT_MUTED_TEXT;
    extern const QString LIGHT_BORDER;

    extern const QString DARK_QSS;
    extern const QString LIGHT_QSS;

    // --- Action buttons of the convert panel ---
    extern const QString STYLE_START;
    extern const QString STYLE_CANCEL;

} // namespace Style
