#pragma once

// Playback position inside the trajectory. Playing advances one frame per
// display refresh, independent of the trajectory's sampling interval.
class FrameCursor
{
public:
    int getCurrentFrame() const { return currentFrame; }
    // Frame of the last wrap or scrub, i.e. what is on screen between ticks
    int getShownFrame() const { return shownFrame; }
    int getLoopCount() const { return loopCount; }
    bool isPlaying() const { return playing; }

    void setPlaying(bool state) { playing = state; }
    void togglePlaying() { playing = !playing; }

    // Start of a render tick: a cursor that has run past the last frame goes
    // back to frame 0 and counts a completed loop.
    void wrap(int frameCount);
    // End of a render tick
    void advance();

    // Explicit scrub request. Ignored until loading has completed; otherwise the
    // requested frame is clamped into range, never wrapped.
    bool scrubTo(int frame, int frameCount, bool loaded);
    bool step(int delta, int frameCount, bool loaded) { return scrubTo(currentFrame + delta, frameCount, loaded); }

    void reset();

private:
    int currentFrame = 0;
    int shownFrame = 0;
    int loopCount = 0;
    bool playing = false;
};
