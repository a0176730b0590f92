#pragma once

#include <QWidget>
#include <QListWidget>
#include <QPushButton>
#include <QString>
#include <QHash>
#include <QPixmap>

class TimelineModel;

// Ordered list of timeline items with thumbnails and add/remove/reorder.
class ClipListPanel : public QWidget {
    Q_OBJECT
public:
    explicit ClipListPanel(TimelineModel* model, QWidget* parent = nullptr);
    ~ClipListPanel();

    QString selectedId() const;
    void selectItem(const QString& id);

signals:
    void addRequested();
    void selectionChanged(const QString& id);

private slots:
    void rebuild();
    void onRemoveClicked();
    void onMoveClicked(int direction);

private:
    static constexpr int ThumbWidth = 96;
    static constexpr int ThumbHeight = 54;
    static constexpr int UserRoleId = Qt::UserRole;

    QPixmap thumbnailFor(const QString& path, bool isVideo);

    TimelineModel* m_model;
    QListWidget* m_listWidget;
    QPushButton* m_addButton;
    QPushButton* m_removeButton;
    QPushButton* m_upButton;
    QPushButton* m_downButton;
    QHash<QString, QPixmap> m_thumbCache;
};
