#pragma once
#include "ParticleField.h"
#include "SessionPhase.h"
#include <vector>

struct CameraState {
    float zoom_distance;
    float rotation_angle;   // radians around the vertical axis
};

// Everything a renderer needs for one frame. Copies only; the renderer never writes back.
struct RenderFrame {
    std::vector<ParticleView> particles;
    CameraState camera;
    SessionPhase phase;
    int countdown_value;
    bool show_go;
    std::vector<int> label_ids;   // selected ids in draw order, only when Complete
};
