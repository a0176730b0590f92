#pragma once

#include <QObject>
#include <QString>
#include <vector>
#include "AudioTrack.h"

// Background music plus the ordered narration list.
class AudioTrackModel : public QObject {
    Q_OBJECT
public:
    explicit AudioTrackModel(QObject* parent = nullptr);
    ~AudioTrackModel();

    // Music
    void setMusic(const AudioTrack& track);
    void clearMusic();
    bool hasMusic() const { return m_music.isValid(); }
    const AudioTrack& music() const { return m_music; }

    void setMusicDuration(double seconds);
    void updateMusicStartPoint(double seconds);
    void updateMusicDelay(double seconds);
    void updateMusicVolume(double volume);
    void setMusicFadeIn(bool enabled);
    void setMusicFadeOut(bool enabled);
    void setMusicFadeInDuration(double seconds);
    void setMusicFadeOutDuration(double seconds);

    // Narration
    QString addNarration(NarrationClip clip);
    void removeNarration(const QString& id);
    void moveNarration(int from, int to);
    void clearNarrations();
    const std::vector<NarrationClip>& narrations() const { return m_narrations; }
    int narrationCount() const { return static_cast<int>(m_narrations.size()); }
    const NarrationClip* findNarration(const QString& id) const;

    void setNarrationDuration(const QString& id, double seconds);
    void updateNarrationStartTime(const QString& id, double seconds);
    void updateNarrationVolume(const QString& id, double volume);
    void toggleNarrationMute(const QString& id);
    void updateNarrationTrimStart(const QString& id, double seconds);
    void updateNarrationTrimEnd(const QString& id, double seconds);

    void clear();

signals:
    void musicChanged();
    void narrationAdded(const QString& id);
    void narrationRemoved(const QString& id);
    void tracksChanged();

private:
    NarrationClip* findNarrationMutable(const QString& id);
    static void normalize(NarrationClip& clip);
    void notifyMusic();

    AudioTrack m_music;
    std::vector<NarrationClip> m_narrations;
};
