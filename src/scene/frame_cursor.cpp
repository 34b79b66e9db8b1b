#include "frame_cursor.h"
#include <algorithm>

void FrameCursor::wrap(int frameCount)
{
    if (currentFrame > frameCount - 1)
    {
        currentFrame = 0;
        ++loopCount;
    }
    shownFrame = currentFrame;
}

void FrameCursor::advance()
{
    if (playing)
        ++currentFrame;
}

bool FrameCursor::scrubTo(int frame, int frameCount, bool loaded)
{
    if (!loaded || frameCount <= 0)
        return false;
    currentFrame = std::clamp(frame, 0, frameCount - 1);
    shownFrame = currentFrame;
    return true;
}

void FrameCursor::reset()
{
    currentFrame = 0;
    shownFrame = 0;
    loopCount = 0;
}
