#pragma once

#include <QWidget>
#include <QString>

class QGroupBox;
class QLabel;
class QDoubleSpinBox;
class QCheckBox;
class QComboBox;
class QSlider;
class TimelineModel;

// Edits the selected timeline item: trim or display time, transform,
// volume and fades. Every edit goes through the model's validated mutators.
class ItemInspector : public QWidget {
    Q_OBJECT
public:
    explicit ItemInspector(TimelineModel* model, QWidget* parent = nullptr);
    ~ItemInspector();

    void setItem(const QString& id);
    QString itemId() const { return m_itemId; }

private slots:
    void refresh();

private:
    QComboBox* makeFadeCombo(QWidget* parent);

    TimelineModel* m_model;
    QString m_itemId;
    bool m_updating = false;

    QLabel* m_infoLabel;
    QGroupBox* m_trimGroup;
    QDoubleSpinBox* m_trimStartSpin;
    QDoubleSpinBox* m_trimEndSpin;
    QGroupBox* m_imageGroup;
    QDoubleSpinBox* m_imageDurationSpin;

    QGroupBox* m_transformGroup;
    QDoubleSpinBox* m_scaleSpin;
    QDoubleSpinBox* m_posXSpin;
    QDoubleSpinBox* m_posYSpin;

    QGroupBox* m_audioGroup;
    QSlider* m_volumeSlider;
    QLabel* m_volumeLabel;
    QCheckBox* m_muteCheck;

    QGroupBox* m_fadeGroup;
    QCheckBox* m_fadeInCheck;
    QCheckBox* m_fadeOutCheck;
    QComboBox* m_fadeInCombo;
    QComboBox* m_fadeOutCombo;
};
