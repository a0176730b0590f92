#include "AudioTrackModel.h"
#include "Logging.h"
#include <QUuid>
#include <algorithm>
#include <cmath>

namespace {

double clampVolume(double v) {
    return qBound(0.0, v, AppConstants::MaxVolume);
}

double clampFadeDuration(double s) {
    return qBound(0.1, s, 10.0);
}

} // namespace

AudioTrackModel::AudioTrackModel(QObject* parent) : QObject(parent) {}
AudioTrackModel::~AudioTrackModel() = default;

void AudioTrackModel::notifyMusic() {
    emit musicChanged();
    emit tracksChanged();
}

void AudioTrackModel::setMusic(const AudioTrack& track) {
    m_music = track;
    m_music.duration = std::max(0.0, m_music.duration);
    m_music.delay = std::max(0.0, m_music.delay);
    m_music.startPoint = qBound(0.0, m_music.startPoint, m_music.duration);
    m_music.volume = clampVolume(m_music.volume);
    qCDebug(srTimeline, "music set: %s", qPrintable(m_music.sourcePath));
    notifyMusic();
}

void AudioTrackModel::clearMusic() {
    if (!m_music.isValid()) return;
    m_music = AudioTrack{};
    notifyMusic();
}

void AudioTrackModel::setMusicDuration(double seconds) {
    if (!m_music.isValid() || !std::isfinite(seconds) || seconds <= 0.0) return;
    m_music.duration = seconds;
    m_music.startPoint = qBound(0.0, m_music.startPoint, seconds);
    notifyMusic();
}

void AudioTrackModel::updateMusicStartPoint(double seconds) {
    if (!m_music.isValid()) return;
    m_music.startPoint = qBound(0.0, seconds, m_music.duration);
    notifyMusic();
}

void AudioTrackModel::updateMusicDelay(double seconds) {
    if (!m_music.isValid()) return;
    m_music.delay = std::max(0.0, seconds);
    notifyMusic();
}

void AudioTrackModel::updateMusicVolume(double volume) {
    if (!m_music.isValid()) return;
    m_music.volume = clampVolume(volume);
    notifyMusic();
}

void AudioTrackModel::setMusicFadeIn(bool enabled) {
    if (!m_music.isValid()) return;
    m_music.fadeIn = enabled;
    notifyMusic();
}

void AudioTrackModel::setMusicFadeOut(bool enabled) {
    if (!m_music.isValid()) return;
    m_music.fadeOut = enabled;
    notifyMusic();
}

void AudioTrackModel::setMusicFadeInDuration(double seconds) {
    if (!m_music.isValid()) return;
    m_music.fadeInDuration = clampFadeDuration(seconds);
    notifyMusic();
}

void AudioTrackModel::setMusicFadeOutDuration(double seconds) {
    if (!m_music.isValid()) return;
    m_music.fadeOutDuration = clampFadeDuration(seconds);
    notifyMusic();
}

void AudioTrackModel::normalize(NarrationClip& clip) {
    clip.duration = std::isfinite(clip.duration) ? std::max(0.0, clip.duration) : 0.0;
    if (!std::isfinite(clip.trimStart)) clip.trimStart = 0.0;
    if (!std::isfinite(clip.trimEnd)) clip.trimEnd = clip.duration;
    clip.trimStart = qBound(0.0, clip.trimStart, clip.duration);
    clip.trimEnd = qBound(clip.trimStart, clip.trimEnd, clip.duration);
    clip.startTime = std::max(0.0, clip.startTime);
    clip.volume = clampVolume(clip.volume);
}

QString AudioTrackModel::addNarration(NarrationClip clip) {
    if (clip.id.isEmpty())
        clip.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    if (clip.trimEnd <= 0.0) clip.trimEnd = clip.duration;
    normalize(clip);

    QString id = clip.id;
    m_narrations.push_back(std::move(clip));
    emit narrationAdded(id);
    emit tracksChanged();
    return id;
}

void AudioTrackModel::removeNarration(const QString& id) {
    auto it = std::find_if(m_narrations.begin(), m_narrations.end(),
                           [&](const NarrationClip& c) { return c.id == id; });
    if (it == m_narrations.end()) return;
    m_narrations.erase(it);
    emit narrationRemoved(id);
    emit tracksChanged();
}

void AudioTrackModel::moveNarration(int from, int to) {
    int n = narrationCount();
    if (from < 0 || from >= n || to < 0 || to >= n || from == to) return;
    NarrationClip moved = std::move(m_narrations[from]);
    m_narrations.erase(m_narrations.begin() + from);
    m_narrations.insert(m_narrations.begin() + to, std::move(moved));
    emit tracksChanged();
}

void AudioTrackModel::clearNarrations() {
    if (m_narrations.empty()) return;
    std::vector<NarrationClip> removed;
    removed.swap(m_narrations);
    for (const auto& c : removed) emit narrationRemoved(c.id);
    emit tracksChanged();
}

const NarrationClip* AudioTrackModel::findNarration(const QString& id) const {
    for (const auto& c : m_narrations) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

NarrationClip* AudioTrackModel::findNarrationMutable(const QString& id) {
    for (auto& c : m_narrations) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

void AudioTrackModel::setNarrationDuration(const QString& id, double seconds) {
    NarrationClip* clip = findNarrationMutable(id);
    if (!clip || !std::isfinite(seconds) || seconds <= 0.0) return;
    bool untrimmed = clip->trimEnd <= 0.0 || clip->trimEnd >= clip->duration;
    clip->duration = seconds;
    if (untrimmed) clip->trimEnd = seconds;
    normalize(*clip);
    emit tracksChanged();
}

void AudioTrackModel::updateNarrationStartTime(const QString& id, double seconds) {
    NarrationClip* clip = findNarrationMutable(id);
    if (!clip) return;
    clip->startTime = std::max(0.0, seconds);
    emit tracksChanged();
}

void AudioTrackModel::updateNarrationVolume(const QString& id, double volume) {
    NarrationClip* clip = findNarrationMutable(id);
    if (!clip) return;
    clip->volume = clampVolume(volume);
    emit tracksChanged();
}

void AudioTrackModel::toggleNarrationMute(const QString& id) {
    NarrationClip* clip = findNarrationMutable(id);
    if (!clip) return;
    clip->isMuted = !clip->isMuted;
    emit tracksChanged();
}

void AudioTrackModel::updateNarrationTrimStart(const QString& id, double seconds) {
    NarrationClip* clip = findNarrationMutable(id);
    if (!clip) return;
    clip->trimStart = std::max(0.0, std::min(seconds, clip->trimEnd - AppConstants::MinNarrationTrimGap));
    normalize(*clip);
    emit tracksChanged();
}

void AudioTrackModel::updateNarrationTrimEnd(const QString& id, double seconds) {
    NarrationClip* clip = findNarrationMutable(id);
    if (!clip) return;
    clip->trimEnd = std::min(clip->duration,
                             std::max(seconds, clip->trimStart + AppConstants::MinNarrationTrimGap));
    normalize(*clip);
    emit tracksChanged();
}

void AudioTrackModel::clear() {
    clearNarrations();
    clearMusic();
}
