#include "Style.h"
#include <QWidget>
#include <QGraphicsDropShadowEffect>

namespace Style {

void applyShadowEffect(QWidget* widget, const QColor& color, int radius, int x_offset, int y_offset)
{
    QGraphicsDropShadowEffect* shadow = new QGraphicsDropShadowEffect(widget);
    shadow->setColor(color);
    shadow->setBlurRadius(radius);
    shadow->setOffset(x_offset, y_offset);
    widget->setGraphicsEffect(shadow);
}

// Dark theme
const QString DARK_ACCENT_COLOR = "#1f6aa5";
const QString DARK_ACCENT_HOVER = "#144870";
const QString DARK_ACCENT_PRESSED = "#0f3a5c";
const QString DARK_BG = "#242424";
const QString DARK_SECONDARY_BG = "#2b2b2b";
const QString DARK_TEXT = "#dce4ee";
const QString DARK_MUTED_TEXT = "#8a8a8a";
const QString DARK_BORDER = "#3d3d3d";

// Light theme
const QString LIGHT_ACCENT_COLOR = "#3a7ebf";
const QString LIGHT_ACCENT_HOVER = "#325882";
const QString LIGHT_ACCENT_PRESSED = "#274466";
const QString LIGHT_BG = "#ebebeb";
const QString LIGHT_SECONDARY_BG = "#f9f9fa";
const QString LIGHT_TEXT = "#1a1a1a";
const QString LIGHT_MUTED_TEXT = "#5c5c5c";
const QString LIGHT_BORDER = "#c4c4c4";

namespace {

// %1 bg, %2 text, %3 accent, %4 hover, %5 pressed, %6 muted text, %7 border, %8 secondary bg
const char* THEME_TEMPLATE = R"(
    QWidget, QMainWindow, QDialog {
        background-color: %1;
        color: %2;
        font-family: 'Segoe UI', 'Arial', sans-serif;
        font-size: 10pt;
    }
    QPushButton {
        background-color: %3; color: white; border: none;
        padding: 8px 16px; border-radius: 6px; font-weight: 600;
    }
    QPushButton:hover { background-color: %4; }
    QPushButton:pressed { background-color: %5; }
    QPushButton:disabled { background-color: %7; color: %6; }
    QLineEdit, QComboBox, QSpinBox, QTextEdit, QListWidget {
        background-color: %8; color: %2; border: 1px solid %7;
        padding: 6px; border-radius: 4px;
        selection-background-color: %3; selection-color: white;
    }
    QLineEdit:focus, QComboBox:focus, QSpinBox:focus { border: 1px solid %3; }
    QGroupBox { border: 1px solid %7; margin-top: 22px; border-radius: 8px; padding-top: 12px; }
    QGroupBox::title {
        subcontrol-origin: margin; subcontrol-position: top left;
        padding: 0 10px; color: %3; font-weight: bold;
    }
    QProgressBar {
        border: 1px solid %7; border-radius: 6px; background-color: %8;
        text-align: center; color: %2; min-height: 18px;
    }
    QProgressBar::chunk { background-color: %3; border-radius: 5px; }
    QCheckBox::indicator { width: 16px; height: 16px; }
    QLabel { color: %2; background-color: transparent; }
    QLabel#muted_label { color: %6; }
    QWidget#header_widget { background-color: %8; border-bottom: 2px solid %3; }
)";

QString buildTheme(const QString& bg, const QString& text, const QString& accent, const QString& hover,
                   const QString& pressed, const QString& muted, const QString& border, const QString& secondary)
{
    return QString(THEME_TEMPLATE)
        .arg(bg, text, accent, hover, pressed, muted, border, secondary);
}

} // namespace

const QString DARK_QSS = buildTheme(DARK_BG, DARK_TEXT, DARK_ACCENT_COLOR, DARK_ACCENT_HOVER,
                                    DARK_ACCENT_PRESSED, DARK_MUTED_TEXT, DARK_BORDER, DARK_SECONDARY_BG);

const QString LIGHT_QSS = buildTheme(LIGHT_BG, LIGHT_TEXT, LIGHT_ACCENT_COLOR, LIGHT_ACCENT_HOVER,
                                     LIGHT_ACCENT_PRESSED, LIGHT_MUTED_TEXT, LIGHT_BORDER, LIGHT_SECONDARY_BG);

const QString& themeStyleSheet(const QString& theme)
{
    return theme == "light" ? LIGHT_QSS : DARK_QSS;
}

const QString STYLE_START = QStringLiteral(R"(
    QPushButton { background:#2fa572; color:white; padding:12px 16px;
                  font-size:13pt; border-radius:8px; font-weight:bold; }
    QPushButton:hover { background:#106a43; }
    QPushButton:disabled { background:#4f545c; color:#a0a0a0; }
)");

const QString STYLE_CANCEL = QStringLiteral(R"(
    QPushButton { background:#d32f2f; color:white; padding:12px 16px;
                  font-size:13pt; border-radius:8px; font-weight:bold; }
    QPushButton:hover { background:#b71c1c; }
    QPushButton:disabled { background:#4f545c; color:#a0a0a0; }
)");

} // namespace Style
