/* SPDX-FileCopyrightText: 2025 adocam Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "camera_track.hpp"
#include "core/logger.hpp"
#include "interpolation.hpp"
#include <algorithm>

namespace adocam::sequencer {

    KeyframeId CameraTrack::addKeyframe(const int64_t time, const double x, const double y,
                                        const double zoom, const double angle, EasingCurve ease) {
        Keyframe kf;
        kf.time = time;
        kf.position = {x, y};
        kf.zoom = zoom;
        kf.angle = angle;
        kf.ease = std::move(ease);
        return addKeyframe(std::move(kf));
    }

    KeyframeId CameraTrack::addKeyframe(Keyframe keyframe) {
        keyframe.id = next_id_++;
        const KeyframeId id = keyframe.id;
        keyframes_.push_back(std::move(keyframe));
        sortKeyframes();
        selected_ = id;
        return id;
    }

    void CameraTrack::clear() {
        keyframes_.clear();
        selected_ = std::nullopt;
    }

    const Keyframe* CameraTrack::find(const KeyframeId id) const {
        const auto it = std::find_if(keyframes_.begin(), keyframes_.end(),
                                     [id](const Keyframe& kf) { return kf.id == id; });
        return it != keyframes_.end() ? &*it : nullptr;
    }

    std::optional<size_t> CameraTrack::indexOf(const KeyframeId id) const {
        for (size_t i = 0; i < keyframes_.size(); ++i) {
            if (keyframes_[i].id == id) return i;
        }
        return std::nullopt;
    }

    int64_t CameraTrack::startTime() const {
        return keyframes_.empty() ? 0 : keyframes_.front().time;
    }

    int64_t CameraTrack::endTime() const {
        return keyframes_.empty() ? 0 : keyframes_.back().time;
    }

    int64_t CameraTrack::duration() const {
        return keyframes_.size() < 2 ? 0 : keyframes_.back().time - keyframes_.front().time;
    }

    CameraState CameraTrack::stateAt(const double time) const {
        return interpolate(keyframes_, time);
    }

    std::vector<CameraState> CameraTrack::samplePath(const int64_t step_ms) const {
        return generatePath(keyframes_, step_ms);
    }

    void CameraTrack::select(const KeyframeId id) {
        if (find(id)) {
            selected_ = id;
        }
    }

    void CameraTrack::selectIndex(const size_t index) {
        if (index < keyframes_.size()) {
            selected_ = keyframes_[index].id;
        }
    }

    bool CameraTrack::selectByPosition(const glm::dvec2& point, const double radius) {
        for (const auto& kf : keyframes_) {
            if (glm::distance(kf.position, point) <= radius) {
                selected_ = kf.id;
                return true;
            }
        }
        selected_ = std::nullopt;
        return false;
    }

    void CameraTrack::selectNext() {
        if (keyframes_.empty()) return;
        const auto idx = selectedIndex();
        if (!idx) {
            selectIndex(0);
            return;
        }
        selectIndex(std::min(*idx + 1, keyframes_.size() - 1));
    }

    void CameraTrack::selectPrev() {
        if (keyframes_.empty()) return;
        const auto idx = selectedIndex();
        if (!idx) {
            selectIndex(keyframes_.size() - 1);
            return;
        }
        selectIndex(*idx > 0 ? *idx - 1 : 0);
    }

    std::optional<size_t> CameraTrack::selectedIndex() const {
        return selected_ ? indexOf(*selected_) : std::nullopt;
    }

    const Keyframe* CameraTrack::selected() const {
        return selected_ ? find(*selected_) : nullptr;
    }

    Keyframe* CameraTrack::selectedMutable() {
        const auto idx = selectedIndex();
        return idx ? &keyframes_[*idx] : nullptr;
    }

    void CameraTrack::moveSelected(const double dx, const double dy) {
        if (auto* kf = selectedMutable()) {
            kf->position += glm::dvec2{dx, dy};
        }
    }

    void CameraTrack::moveTimeSelected(const int64_t dt) {
        auto* kf = selectedMutable();
        if (!kf) return;
        kf->time = std::max<int64_t>(0, kf->time + dt);
        sortKeyframes();
    }

    void CameraTrack::setSelectedState(const CameraState& state) {
        if (auto* kf = selectedMutable()) {
            kf->position = state.position;
            kf->zoom = state.zoom;
            kf->angle = state.angle;
        }
    }

    void CameraTrack::deleteSelected() {
        const auto idx = selectedIndex();
        if (!idx) return;

        keyframes_.erase(keyframes_.begin() + static_cast<ptrdiff_t>(*idx));
        if (keyframes_.empty()) {
            selected_ = std::nullopt;
            return;
        }
        selected_ = keyframes_[std::min(*idx, keyframes_.size() - 1)].id;
    }

    std::optional<KeyframeId> CameraTrack::duplicateSelected(const int64_t offset_ms) {
        const Keyframe* source = selected();
        if (!source) return std::nullopt;

        Keyframe copy = *source;
        copy.time = std::max<int64_t>(0, copy.time + offset_ms);
        const KeyframeId id = addKeyframe(std::move(copy));
        LOG_DEBUG("Duplicated keyframe at {}ms as id {}", keyframes_[*indexOf(id)].time, id);
        return id;
    }

    void CameraTrack::cycleEase(const int direction) {
        if (auto* kf = selectedMutable()) {
            kf->ease.cycle(direction);
        }
    }

    void CameraTrack::setSelectedEase(const EasingCurve& ease) {
        if (auto* kf = selectedMutable()) {
            kf->ease = ease;
        }
    }

    EasingCurve* CameraTrack::selectedEase() {
        auto* kf = selectedMutable();
        return kf ? &kf->ease : nullptr;
    }

    void CameraTrack::regenerateSamples(const size_t count) {
        for (auto& kf : keyframes_) {
            kf.ease.regenerateSamples(count);
        }
    }

    void CameraTrack::sortKeyframes() {
        std::stable_sort(keyframes_.begin(), keyframes_.end());
    }

} // namespace adocam::sequencer
