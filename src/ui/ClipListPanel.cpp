#include "ClipListPanel.h"
#include "TimelineModel.h"
#include "VideoDecoder.h"
#include "ImageUtil.h"
#include "TimeUtil.h"
#include <QHBoxLayout>
#include <QVBoxLayout>
#include <QPainter>

ClipListPanel::ClipListPanel(TimelineModel* model, QWidget* parent)
    : QWidget(parent), m_model(model) {
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(4, 4, 4, 4);

    m_listWidget = new QListWidget(this);
    m_listWidget->setIconSize(QSize(ThumbWidth, ThumbHeight));
    m_listWidget->setSelectionMode(QAbstractItemView::SingleSelection);
    layout->addWidget(m_listWidget, 1);

    auto* buttons = new QHBoxLayout();
    m_addButton = new QPushButton("Add...", this);
    m_removeButton = new QPushButton("Remove", this);
    m_upButton = new QPushButton("▲", this);
    m_downButton = new QPushButton("▼", this);
    m_upButton->setFixedWidth(30);
    m_downButton->setFixedWidth(30);
    buttons->addWidget(m_addButton);
    buttons->addWidget(m_removeButton);
    buttons->addStretch();
    buttons->addWidget(m_upButton);
    buttons->addWidget(m_downButton);
    layout->addLayout(buttons);

    connect(m_addButton, &QPushButton::clicked, this, &ClipListPanel::addRequested);
    connect(m_removeButton, &QPushButton::clicked, this, &ClipListPanel::onRemoveClicked);
    connect(m_upButton, &QPushButton::clicked, this, [this]() { onMoveClicked(-1); });
    connect(m_downButton, &QPushButton::clicked, this, [this]() { onMoveClicked(1); });
    connect(m_listWidget, &QListWidget::currentRowChanged, this, [this](int) {
        emit selectionChanged(selectedId());
    });
    connect(m_model, &TimelineModel::itemsChanged, this, &ClipListPanel::rebuild);
}

ClipListPanel::~ClipListPanel() = default;

QString ClipListPanel::selectedId() const {
    QListWidgetItem* item = m_listWidget->currentItem();
    return item ? item->data(UserRoleId).toString() : QString();
}

void ClipListPanel::selectItem(const QString& id) {
    for (int i = 0; i < m_listWidget->count(); ++i) {
        if (m_listWidget->item(i)->data(UserRoleId).toString() == id) {
            m_listWidget->setCurrentRow(i);
            return;
        }
    }
}

QPixmap ClipListPanel::thumbnailFor(const QString& path, bool isVideo) {
    auto it = m_thumbCache.find(path);
    if (it != m_thumbCache.end()) return it.value();

    QImage frame;
    if (isVideo) {
        VideoDecoder decoder;
        double pts = 0.0;
        if (decoder.open(path)) {
            if (!decoder.decodeNextFrame(frame, pts)) frame = QImage();
            decoder.close();
        }
    } else {
        frame = QImage(path);
    }
    if (frame.isNull())
        frame = ImageUtil::createPlaceholder(ThumbWidth, ThumbHeight, isVideo ? "Video" : "Image");

    QPixmap thumb = QPixmap::fromImage(frame).scaled(
        ThumbWidth, ThumbHeight, Qt::KeepAspectRatio, Qt::SmoothTransformation);
    m_thumbCache.insert(path, thumb);
    return thumb;
}

void ClipListPanel::rebuild() {
    QString keep = selectedId();
    QSignalBlocker blocker(m_listWidget);
    m_listWidget->clear();

    for (const auto& media : m_model->items()) {
        QString label = QString("%1\n%2  %3")
            .arg(media.displayName)
            .arg(media.isVideo() ? "Video" : "Image")
            .arg(TimeUtil::secondsToMMSS(media.duration));
        auto* item = new QListWidgetItem(QIcon(thumbnailFor(media.sourcePath, media.isVideo())), label);
        item->setData(UserRoleId, media.id);
        item->setToolTip(media.sourcePath);
        m_listWidget->addItem(item);
    }

    blocker.unblock();
    selectItem(keep);
    if (selectedId() != keep) emit selectionChanged(selectedId());
}

void ClipListPanel::onRemoveClicked() {
    QString id = selectedId();
    if (!id.isEmpty()) m_model->removeItem(id);
}

void ClipListPanel::onMoveClicked(int direction) {
    int row = m_listWidget->currentRow();
    int target = row + direction;
    if (row < 0 || target < 0 || target >= m_model->itemCount()) return;
    QString id = selectedId();
    m_model->moveItem(row, target);
    selectItem(id);
}
