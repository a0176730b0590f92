#include "AudioPanel.h"
#include "AudioTrackModel.h"
#include "TimeUtil.h"
#include <QCheckBox>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSlider>
#include <QVBoxLayout>

namespace {

QDoubleSpinBox* makeSecondsSpin(QWidget* parent) {
    auto* spin = new QDoubleSpinBox(parent);
    spin->setDecimals(2);
    spin->setSingleStep(0.1);
    spin->setRange(0.0, 36000.0);
    spin->setSuffix(" s");
    spin->setKeyboardTracking(false);
    return spin;
}

QSlider* makeVolumeSlider(QWidget* parent) {
    auto* slider = new QSlider(Qt::Horizontal, parent);
    slider->setRange(0, static_cast<int>(AppConstants::MaxVolume * 100));
    return slider;
}

QComboBox* makeMusicFadeCombo(QWidget* parent) {
    auto* combo = new QComboBox(parent);
    for (double d : {1.0, 2.0, 3.0, 5.0}) combo->addItem(QString("%1 s").arg(d), d);
    return combo;
}

} // namespace

AudioPanel::AudioPanel(AudioTrackModel* model, QWidget* parent)
    : QWidget(parent), m_model(model) {
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(4, 4, 4, 4);
    layout->setAlignment(Qt::AlignTop);

    // Music
    auto* musicHeader = new QHBoxLayout();
    m_musicLabel = new QLabel("No music", this);
    auto* setMusicBtn = new QPushButton("Music...", this);
    m_clearMusicBtn = new QPushButton("Clear", this);
    musicHeader->addWidget(m_musicLabel, 1);
    musicHeader->addWidget(setMusicBtn);
    musicHeader->addWidget(m_clearMusicBtn);
    layout->addLayout(musicHeader);

    m_musicGroup = new QGroupBox("Background Music", this);
    auto* musicForm = new QFormLayout(m_musicGroup);
    m_startPointSpin = makeSecondsSpin(m_musicGroup);
    m_delaySpin = makeSecondsSpin(m_musicGroup);
    m_musicVolumeSlider = makeVolumeSlider(m_musicGroup);
    musicForm->addRow("Start at:", m_startPointSpin);
    musicForm->addRow("Delay:", m_delaySpin);
    musicForm->addRow("Volume:", m_musicVolumeSlider);

    auto* fadeInRow = new QHBoxLayout();
    m_musicFadeInCheck = new QCheckBox("Fade in", m_musicGroup);
    m_musicFadeInCombo = makeMusicFadeCombo(m_musicGroup);
    fadeInRow->addWidget(m_musicFadeInCheck);
    fadeInRow->addWidget(m_musicFadeInCombo);
    musicForm->addRow(fadeInRow);

    auto* fadeOutRow = new QHBoxLayout();
    m_musicFadeOutCheck = new QCheckBox("Fade out", m_musicGroup);
    m_musicFadeOutCombo = makeMusicFadeCombo(m_musicGroup);
    fadeOutRow->addWidget(m_musicFadeOutCheck);
    fadeOutRow->addWidget(m_musicFadeOutCombo);
    musicForm->addRow(fadeOutRow);
    layout->addWidget(m_musicGroup);

    // Narration
    auto* narrationHeader = new QHBoxLayout();
    narrationHeader->addWidget(new QLabel("Narration", this), 1);
    auto* addNarrationBtn = new QPushButton("Add...", this);
    m_removeNarrationBtn = new QPushButton("Remove", this);
    narrationHeader->addWidget(addNarrationBtn);
    narrationHeader->addWidget(m_removeNarrationBtn);
    layout->addLayout(narrationHeader);

    m_narrationList = new QListWidget(this);
    m_narrationList->setMaximumHeight(120);
    layout->addWidget(m_narrationList);

    m_narrationGroup = new QGroupBox("Selected Narration", this);
    auto* narrationForm = new QFormLayout(m_narrationGroup);
    m_narrationStartSpin = makeSecondsSpin(m_narrationGroup);
    m_narrationTrimStartSpin = makeSecondsSpin(m_narrationGroup);
    m_narrationTrimEndSpin = makeSecondsSpin(m_narrationGroup);
    m_narrationVolumeSlider = makeVolumeSlider(m_narrationGroup);
    m_narrationMuteCheck = new QCheckBox("Mute", m_narrationGroup);
    narrationForm->addRow("Starts at:", m_narrationStartSpin);
    narrationForm->addRow("Trim start:", m_narrationTrimStartSpin);
    narrationForm->addRow("Trim end:", m_narrationTrimEndSpin);
    narrationForm->addRow("Volume:", m_narrationVolumeSlider);
    narrationForm->addRow(m_narrationMuteCheck);
    layout->addWidget(m_narrationGroup);

    connect(setMusicBtn, &QPushButton::clicked, this, &AudioPanel::setMusicRequested);
    connect(m_clearMusicBtn, &QPushButton::clicked, m_model, &AudioTrackModel::clearMusic);
    connect(m_startPointSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, [this](double v) {
        if (!m_updating) m_model->updateMusicStartPoint(v);
    });
    connect(m_delaySpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, [this](double v) {
        if (!m_updating) m_model->updateMusicDelay(v);
    });
    connect(m_musicVolumeSlider, &QSlider::valueChanged, this, [this](int v) {
        if (!m_updating) m_model->updateMusicVolume(v / 100.0);
    });
    connect(m_musicFadeInCheck, &QCheckBox::toggled, this, [this](bool on) {
        if (!m_updating) m_model->setMusicFadeIn(on);
    });
    connect(m_musicFadeOutCheck, &QCheckBox::toggled, this, [this](bool on) {
        if (!m_updating) m_model->setMusicFadeOut(on);
    });
    connect(m_musicFadeInCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int) {
        if (!m_updating) m_model->setMusicFadeInDuration(m_musicFadeInCombo->currentData().toDouble());
    });
    connect(m_musicFadeOutCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int) {
        if (!m_updating) m_model->setMusicFadeOutDuration(m_musicFadeOutCombo->currentData().toDouble());
    });

    connect(addNarrationBtn, &QPushButton::clicked, this, &AudioPanel::addNarrationRequested);
    connect(m_removeNarrationBtn, &QPushButton::clicked, this, [this]() {
        QString id = selectedNarrationId();
        if (!id.isEmpty()) m_model->removeNarration(id);
    });
    connect(m_narrationList, &QListWidget::currentRowChanged, this, &AudioPanel::refreshNarrationEditor);
    connect(m_narrationStartSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, [this](double v) {
        if (!m_updating) m_model->updateNarrationStartTime(selectedNarrationId(), v);
    });
    connect(m_narrationTrimStartSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, [this](double v) {
        if (!m_updating) m_model->updateNarrationTrimStart(selectedNarrationId(), v);
    });
    connect(m_narrationTrimEndSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, [this](double v) {
        if (!m_updating) m_model->updateNarrationTrimEnd(selectedNarrationId(), v);
    });
    connect(m_narrationVolumeSlider, &QSlider::valueChanged, this, [this](int v) {
        if (!m_updating) m_model->updateNarrationVolume(selectedNarrationId(), v / 100.0);
    });
    connect(m_narrationMuteCheck, &QCheckBox::toggled, this, [this](bool) {
        if (!m_updating) m_model->toggleNarrationMute(selectedNarrationId());
    });

    connect(m_model, &AudioTrackModel::musicChanged, this, &AudioPanel::refreshMusic);
    connect(m_model, &AudioTrackModel::tracksChanged, this, &AudioPanel::refreshNarrations);

    refreshMusic();
    refreshNarrations();
}

AudioPanel::~AudioPanel() = default;

QString AudioPanel::selectedNarrationId() const {
    auto* current = m_narrationList->currentItem();
    return current ? current->data(Qt::UserRole).toString() : QString();
}

void AudioPanel::refreshMusic() {
    const AudioTrack& music = m_model->music();
    bool has = music.isValid();
    m_musicLabel->setText(has ? music.displayName : "No music");
    m_clearMusicBtn->setEnabled(has);
    m_musicGroup->setEnabled(has);
    if (!has) return;

    m_updating = true;
    m_startPointSpin->setMaximum(music.duration > 0.0 ? music.duration : 36000.0);
    m_startPointSpin->setValue(music.startPoint);
    m_delaySpin->setValue(music.delay);
    m_musicVolumeSlider->setValue(qRound(music.volume * 100));
    m_musicFadeInCheck->setChecked(music.fadeIn);
    m_musicFadeOutCheck->setChecked(music.fadeOut);
    m_musicFadeInCombo->setCurrentIndex(m_musicFadeInCombo->findData(music.fadeInDuration));
    m_musicFadeOutCombo->setCurrentIndex(m_musicFadeOutCombo->findData(music.fadeOutDuration));
    m_updating = false;
}

void AudioPanel::refreshNarrations() {
    QString selected = selectedNarrationId();
    {
        QSignalBlocker blocker(m_narrationList);
        m_narrationList->clear();
        for (const auto& clip : m_model->narrations()) {
            auto* entry = new QListWidgetItem(QString("%1  @ %2")
                .arg(clip.displayName)
                .arg(TimeUtil::secondsToMMSS(clip.startTime)), m_narrationList);
            entry->setData(Qt::UserRole, clip.id);
            if (clip.id == selected) m_narrationList->setCurrentItem(entry);
        }
    }
    refreshNarrationEditor();
}

void AudioPanel::refreshNarrationEditor() {
    const NarrationClip* clip = m_model->findNarration(selectedNarrationId());
    m_removeNarrationBtn->setEnabled(clip != nullptr);
    m_narrationGroup->setEnabled(clip != nullptr);
    if (!clip) return;

    m_updating = true;
    double maxTrim = clip->duration > 0.0 ? clip->duration : 36000.0;
    m_narrationTrimStartSpin->setMaximum(maxTrim);
    m_narrationTrimEndSpin->setMaximum(maxTrim);
    m_narrationStartSpin->setValue(clip->startTime);
    m_narrationTrimStartSpin->setValue(clip->trimStart);
    m_narrationTrimEndSpin->setValue(clip->trimEnd);
    m_narrationVolumeSlider->setValue(qRound(clip->volume * 100));
    m_narrationMuteCheck->setChecked(clip->isMuted);
    m_updating = false;
}
