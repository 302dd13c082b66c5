#pragma once

#include <QDialog>

class QLineEdit;
class QSpinBox;

namespace todo {
namespace core {
class AppSettings;
}

namespace ui {

class SettingsDialog : public QDialog
{
    Q_OBJECT

public:
    explicit SettingsDialog(core::AppSettings &settings, QWidget *parent = nullptr);

    void accept() override;

private:
    void setupUi();
    void browseDataFile();

    core::AppSettings &m_settings;
    QLineEdit *m_dataFileEdit = nullptr;
    QSpinBox *m_timeoutSpin = nullptr;
};

} // namespace ui
} // namespace todo
