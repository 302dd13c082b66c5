#include "todo/ui/dialogs/SettingsDialog.hpp"

#include <QDialogButtonBox>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSpinBox>
#include <QVBoxLayout>

#include "todo/core/AppSettings.hpp"

namespace todo {
namespace ui {

SettingsDialog::SettingsDialog(core::AppSettings &settings, QWidget *parent)
    : QDialog(parent)
    , m_settings(settings)
{
    setWindowTitle(tr("Settings"));
    resize(520, 200);
    setupUi();
}

void SettingsDialog::setupUi()
{
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(16, 16, 16, 16);
    layout->setSpacing(12);

    auto *form = new QFormLayout();

    auto *fileRow = new QHBoxLayout();
    m_dataFileEdit = new QLineEdit(this);
    m_dataFileEdit->setText(m_settings.dataFilePath());
    m_dataFileEdit->setPlaceholderText(core::AppSettings::defaultDataFilePath());
    auto *browseButton = new QPushButton(tr("Browse…"), this);
    connect(browseButton, &QPushButton::clicked, this, &SettingsDialog::browseDataFile);
    fileRow->addWidget(m_dataFileEdit, 1);
    fileRow->addWidget(browseButton);
    form->addRow(tr("Data file"), fileRow);

    m_timeoutSpin = new QSpinBox(this);
    m_timeoutSpin->setRange(1, 120);
    m_timeoutSpin->setSuffix(tr(" s"));
    m_timeoutSpin->setValue(m_settings.notificationTimeoutMs() / 1000);
    form->addRow(tr("Notification display time"), m_timeoutSpin);

    layout->addLayout(form);

    auto *hint = new QLabel(tr("A changed data file is used after the next start."), this);
    hint->setWordWrap(true);
    layout->addWidget(hint);
    layout->addStretch(1);

    auto *buttonBox = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, Qt::Horizontal, this);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &SettingsDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &SettingsDialog::reject);
    layout->addWidget(buttonBox);
}

void SettingsDialog::browseDataFile()
{
    const QString path = QFileDialog::getSaveFileName(this,
                                                      tr("Choose data file"),
                                                      m_dataFileEdit->text(),
                                                      tr("JSON files (*.json)"),
                                                      nullptr,
                                                      QFileDialog::DontConfirmOverwrite);
    if (!path.isEmpty()) {
        m_dataFileEdit->setText(path);
    }
}

void SettingsDialog::accept()
{
    m_settings.setDataFilePath(m_dataFileEdit->text());
    m_settings.setNotificationTimeoutMs(m_timeoutSpin->value() * 1000);
    QDialog::accept();
}

} // namespace ui
} // namespace todo
