#include "ItemInspector.h"
#include "TimelineModel.h"
#include "TimeUtil.h"
#include <QCheckBox>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QScrollArea>
#include <QSlider>
#include <QVBoxLayout>

ItemInspector::ItemInspector(TimelineModel* model, QWidget* parent)
    : QWidget(parent), m_model(model) {
    auto* outer = new QVBoxLayout(this);
    outer->setContentsMargins(4, 4, 4, 4);

    auto* scrollArea = new QScrollArea(this);
    scrollArea->setWidgetResizable(true);
    auto* content = new QWidget();
    auto* layout = new QVBoxLayout(content);
    layout->setAlignment(Qt::AlignTop);

    m_infoLabel = new QLabel("No item selected", content);
    m_infoLabel->setWordWrap(true);
    layout->addWidget(m_infoLabel);

    // Trim (video)
    m_trimGroup = new QGroupBox("Trim", content);
    auto* trimForm = new QFormLayout(m_trimGroup);
    m_trimStartSpin = new QDoubleSpinBox(m_trimGroup);
    m_trimEndSpin = new QDoubleSpinBox(m_trimGroup);
    for (auto* spin : {m_trimStartSpin, m_trimEndSpin}) {
        spin->setDecimals(2);
        spin->setSingleStep(0.1);
        spin->setSuffix(" s");
        spin->setKeyboardTracking(false);
    }
    trimForm->addRow("Start:", m_trimStartSpin);
    trimForm->addRow("End:", m_trimEndSpin);
    layout->addWidget(m_trimGroup);

    // Display time (image)
    m_imageGroup = new QGroupBox("Display Time", content);
    auto* imageForm = new QFormLayout(m_imageGroup);
    m_imageDurationSpin = new QDoubleSpinBox(m_imageGroup);
    m_imageDurationSpin->setRange(AppConstants::MinImageDuration, AppConstants::MaxImageDuration);
    m_imageDurationSpin->setSingleStep(0.5);
    m_imageDurationSpin->setSuffix(" s");
    m_imageDurationSpin->setKeyboardTracking(false);
    imageForm->addRow("Duration:", m_imageDurationSpin);
    layout->addWidget(m_imageGroup);

    // Transform
    m_transformGroup = new QGroupBox("Transform", content);
    auto* tForm = new QFormLayout(m_transformGroup);
    m_scaleSpin = new QDoubleSpinBox(m_transformGroup);
    m_scaleSpin->setRange(AppConstants::MinScale, AppConstants::MaxScale);
    m_scaleSpin->setSingleStep(0.05);
    m_posXSpin = new QDoubleSpinBox(m_transformGroup);
    m_posXSpin->setRange(-AppConstants::MaxPositionX, AppConstants::MaxPositionX);
    m_posYSpin = new QDoubleSpinBox(m_transformGroup);
    m_posYSpin->setRange(-AppConstants::MaxPositionY, AppConstants::MaxPositionY);
    for (auto* spin : {m_posXSpin, m_posYSpin}) {
        spin->setDecimals(0);
        spin->setSuffix(" px");
    }
    auto* resetBtn = new QPushButton("Reset Transform", m_transformGroup);
    tForm->addRow("Scale:", m_scaleSpin);
    tForm->addRow("X:", m_posXSpin);
    tForm->addRow("Y:", m_posYSpin);
    tForm->addRow(resetBtn);
    layout->addWidget(m_transformGroup);

    // Audio (video)
    m_audioGroup = new QGroupBox("Audio", content);
    auto* audioLayout = new QHBoxLayout(m_audioGroup);
    m_volumeSlider = new QSlider(Qt::Horizontal, m_audioGroup);
    m_volumeSlider->setRange(0, static_cast<int>(AppConstants::MaxVolume * 100));
    m_volumeLabel = new QLabel("100%", m_audioGroup);
    m_volumeLabel->setFixedWidth(44);
    m_muteCheck = new QCheckBox("Mute", m_audioGroup);
    audioLayout->addWidget(m_volumeSlider, 1);
    audioLayout->addWidget(m_volumeLabel);
    audioLayout->addWidget(m_muteCheck);
    layout->addWidget(m_audioGroup);

    // Fades
    m_fadeGroup = new QGroupBox("Fades", content);
    auto* fadeForm = new QFormLayout(m_fadeGroup);
    auto* inRow = new QHBoxLayout();
    m_fadeInCheck = new QCheckBox("Fade in", m_fadeGroup);
    m_fadeInCombo = makeFadeCombo(m_fadeGroup);
    inRow->addWidget(m_fadeInCheck);
    inRow->addWidget(m_fadeInCombo);
    auto* outRow = new QHBoxLayout();
    m_fadeOutCheck = new QCheckBox("Fade out", m_fadeGroup);
    m_fadeOutCombo = makeFadeCombo(m_fadeGroup);
    outRow->addWidget(m_fadeOutCheck);
    outRow->addWidget(m_fadeOutCombo);
    fadeForm->addRow(inRow);
    fadeForm->addRow(outRow);
    layout->addWidget(m_fadeGroup);

    scrollArea->setWidget(content);
    outer->addWidget(scrollArea);

    connect(m_trimStartSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, [this](double v) {
        if (m_updating) return;
        if (const MediaItem* item = m_model->find(m_itemId))
            m_model->updateVideoTrim(m_itemId, v, item->trimEnd);
    });
    connect(m_trimEndSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, [this](double v) {
        if (m_updating) return;
        if (const MediaItem* item = m_model->find(m_itemId))
            m_model->updateVideoTrim(m_itemId, item->trimStart, v);
    });
    connect(m_imageDurationSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, [this](double v) {
        if (!m_updating) m_model->updateImageDuration(m_itemId, v);
    });
    connect(m_scaleSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, [this](double v) {
        if (!m_updating) m_model->updateScale(m_itemId, v);
    });
    auto onPosition = [this](double) {
        if (!m_updating) m_model->updatePosition(m_itemId, m_posXSpin->value(), m_posYSpin->value());
    };
    connect(m_posXSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, onPosition);
    connect(m_posYSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, onPosition);
    connect(resetBtn, &QPushButton::clicked, this, [this]() { m_model->resetTransform(m_itemId); });

    connect(m_volumeSlider, &QSlider::valueChanged, this, [this](int v) {
        m_volumeLabel->setText(QString("%1%").arg(v));
        if (!m_updating) m_model->updateVolume(m_itemId, v / 100.0);
    });
    connect(m_muteCheck, &QCheckBox::toggled, this, [this](bool) {
        if (!m_updating) m_model->toggleMute(m_itemId);
    });

    connect(m_fadeInCheck, &QCheckBox::toggled, this, [this](bool on) {
        if (!m_updating) m_model->setFadeIn(m_itemId, on);
    });
    connect(m_fadeOutCheck, &QCheckBox::toggled, this, [this](bool on) {
        if (!m_updating) m_model->setFadeOut(m_itemId, on);
    });
    connect(m_fadeInCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int) {
        if (!m_updating) m_model->setFadeInDuration(m_itemId, m_fadeInCombo->currentData().toDouble());
    });
    connect(m_fadeOutCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int) {
        if (!m_updating) m_model->setFadeOutDuration(m_itemId, m_fadeOutCombo->currentData().toDouble());
    });

    connect(m_model, &TimelineModel::itemsChanged, this, &ItemInspector::refresh);

    refresh();
}

ItemInspector::~ItemInspector() = default;

QComboBox* ItemInspector::makeFadeCombo(QWidget* parent) {
    auto* combo = new QComboBox(parent);
    for (double d : {0.5, 1.0, 2.0}) combo->addItem(QString("%1 s").arg(d), d);
    return combo;
}

void ItemInspector::setItem(const QString& id) {
    m_itemId = id;
    refresh();
}

void ItemInspector::refresh() {
    const MediaItem* item = m_model->find(m_itemId);
    bool has = item != nullptr;

    m_trimGroup->setVisible(has && item->isVideo());
    m_imageGroup->setVisible(has && item->isImage());
    m_transformGroup->setVisible(has);
    m_audioGroup->setVisible(has && item->isVideo());
    m_fadeGroup->setVisible(has);

    if (!has) {
        m_infoLabel->setText("No item selected");
        return;
    }

    m_updating = true;

    m_infoLabel->setText(QString("<b>%1</b><br>%2, %3")
        .arg(item->displayName)
        .arg(item->isVideo() ? "Video" : "Image")
        .arg(TimeUtil::secondsToHMSms(item->duration)));

    if (item->isVideo()) {
        m_trimStartSpin->setRange(0.0, item->originalDuration);
        m_trimEndSpin->setRange(0.0, item->originalDuration);
        m_trimStartSpin->setValue(item->trimStart);
        m_trimEndSpin->setValue(item->trimEnd);
        m_volumeSlider->setValue(qRound(item->volume * 100));
        m_volumeLabel->setText(QString("%1%").arg(qRound(item->volume * 100)));
        m_muteCheck->setChecked(item->isMuted);
    } else {
        m_imageDurationSpin->setValue(item->duration);
    }

    m_scaleSpin->setValue(item->transform.scale);
    m_posXSpin->setValue(item->transform.positionX);
    m_posYSpin->setValue(item->transform.positionY);

    m_fadeInCheck->setChecked(item->fades.fadeIn);
    m_fadeOutCheck->setChecked(item->fades.fadeOut);
    m_fadeInCombo->setCurrentIndex(m_fadeInCombo->findData(item->fades.fadeInDuration));
    m_fadeOutCombo->setCurrentIndex(m_fadeOutCombo->findData(item->fades.fadeOutDuration));

    m_updating = false;
}
