#ifndef SCALEINPUTDIALOG_H
#define SCALEINPUTDIALOG_H

#include <QDialog>

class QLineEdit;
class QLabel;
class SessionStore;

// Asks for the real length of the distance picked in Scale mode. The dialog
// stays open while the store rejects the input.
class ScaleInputDialog : public QDialog
{
    Q_OBJECT
public:
    ScaleInputDialog(SessionStore* store, double pixels, const QString& suggestedUnit,
                     QWidget* parent = nullptr);

public slots:
    void accept() override;
    void reject() override;

private:
    SessionStore* m_store{nullptr};

    QLineEdit* m_lengthEdit{nullptr};
    QLineEdit* m_unitEdit{nullptr};
    QLabel* m_errorLabel{nullptr};
};

#endif // SCALEINPUTDIALOG_H
