#ifndef KGVIEW_CONFIG_H
#define KGVIEW_CONFIG_H

// Compile-time defaults. Values the user may change at runtime are persisted
// through ViewerSettings and fall back to these when missing or out of range.

namespace kgview {
namespace config {

// --- Window ---
constexpr int kDefaultWindowWidth = 1280;
constexpr int kDefaultWindowHeight = 720;
constexpr const char* kWindowTitle = "kgview";

// --- Persistence ---
constexpr const char* kAppConfigDirName = ".kgview";
constexpr const char* kDatabaseFileName = "kgview.db";

// --- Layout ---
constexpr int kDefaultLayoutIterations = 50;
constexpr float kDefaultRepulsion = 100.0f;
constexpr float kDefaultAttraction = 0.01f;
constexpr float kDefaultInitialRadius = 50.0f;
constexpr float kDefaultMinDistance = 1.0f;
constexpr float kDefaultMaxStep = 10.0f;
constexpr float kDefaultInitialJitter = 0.5f;
constexpr int kDefaultSpatialHashThreshold = 2000;
constexpr float kDefaultRepulsionCutoff = 250.0f;

// --- Camera ---
constexpr float kCameraFovDegrees = 60.0f;
constexpr float kCameraNearPlane = 0.1f;
constexpr float kCameraFarPlane = 5000.0f;
constexpr float kCameraInitialDistance = 150.0f;

// --- Interaction ---
constexpr float kDefaultDampingFactor = 0.1f;
constexpr float kDefaultMoveSpeed = 60.0f;     // world units per second
constexpr float kDefaultHitRadiusPx = 8.0f;
constexpr float kClickDragThresholdPx = 4.0f;
constexpr float kOrbitRadiansPerPixel = 0.005f;
constexpr float kZoomStep = 0.1f;

// --- Rendering ---
constexpr float kNodePointSizePx = 10.0f;
constexpr int kStarfieldPointCount = 1500;
constexpr float kStarfieldRadius = 1500.0f;

} // namespace config
} // namespace kgview

#endif // KGVIEW_CONFIG_H
