#pragma once

#include <QWidget>
#include <QString>

class QLabel;
class QListWidget;
class QDoubleSpinBox;
class QCheckBox;
class QComboBox;
class QSlider;
class QPushButton;
class QGroupBox;
class AudioTrackModel;

// Background music and narration controls.
class AudioPanel : public QWidget {
    Q_OBJECT
public:
    explicit AudioPanel(AudioTrackModel* model, QWidget* parent = nullptr);
    ~AudioPanel();

    QString selectedNarrationId() const;

signals:
    void setMusicRequested();
    void addNarrationRequested();

private slots:
    void refreshMusic();
    void refreshNarrations();
    void refreshNarrationEditor();

private:
    AudioTrackModel* m_model;
    bool m_updating = false;

    // Music
    QLabel* m_musicLabel;
    QPushButton* m_clearMusicBtn;
    QGroupBox* m_musicGroup;
    QDoubleSpinBox* m_startPointSpin;
    QDoubleSpinBox* m_delaySpin;
    QSlider* m_musicVolumeSlider;
    QCheckBox* m_musicFadeInCheck;
    QCheckBox* m_musicFadeOutCheck;
    QComboBox* m_musicFadeInCombo;
    QComboBox* m_musicFadeOutCombo;

    // Narration
    QListWidget* m_narrationList;
    QPushButton* m_removeNarrationBtn;
    QGroupBox* m_narrationGroup;
    QDoubleSpinBox* m_narrationStartSpin;
    QDoubleSpinBox* m_narrationTrimStartSpin;
    QDoubleSpinBox* m_narrationTrimEndSpin;
    QSlider* m_narrationVolumeSlider;
    QCheckBox* m_narrationMuteCheck;
};
