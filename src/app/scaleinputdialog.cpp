#include "app/scaleinputdialog.h"
#include "sessionstore.h"
#include "lengthformatter.h"

#include <QVBoxLayout>
#include <QFormLayout>
#include <QLineEdit>
#include <QLabel>
#include <QDialogButtonBox>

ScaleInputDialog::ScaleInputDialog(SessionStore* store, double pixels,
                                   const QString& suggestedUnit, QWidget* parent)
    : QDialog(parent)
    , m_store(store)
{
    setWindowTitle("Set Scale");
    setModal(true);
    setMinimumWidth(320);

    auto *layout = new QVBoxLayout(this);

    auto *info = new QLabel(QString("Picked distance: %1 px")
                                .arg(LengthFormatter::formatSignificant(pixels, store->roundingMode())),
                            this);
    layout->addWidget(info);

    auto *form = new QFormLayout();
    m_lengthEdit = new QLineEdit(this);
    m_lengthEdit->setPlaceholderText("e.g. 10 or 2,5");
    form->addRow("Real length:", m_lengthEdit);
    m_unitEdit = new QLineEdit(suggestedUnit, this);
    m_unitEdit->setPlaceholderText(LengthFormatter::defaultUnit());
    form->addRow("Unit:", m_unitEdit);
    layout->addLayout(form);

    m_errorLabel = new QLabel(this);
    m_errorLabel->setStyleSheet("color: #c0392b;");
    m_errorLabel->setWordWrap(true);
    m_errorLabel->hide();
    layout->addWidget(m_errorLabel);

    auto *buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttons, &QDialogButtonBox::accepted, this, &ScaleInputDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &ScaleInputDialog::reject);
    layout->addWidget(buttons);

    m_lengthEdit->setFocus();
}

void ScaleInputDialog::accept()
{
    if (!m_store->applyScaleInput(m_unitEdit->text(), m_lengthEdit->text())) {
        m_errorLabel->setText(m_store->statusText());
        m_errorLabel->show();
        m_lengthEdit->selectAll();
        m_lengthEdit->setFocus();
        return;
    }
    QDialog::accept();
}

void ScaleInputDialog::reject()
{
    m_store->cancelScaleInput();
    QDialog::reject();
}
