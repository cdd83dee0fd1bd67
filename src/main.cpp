#include "ofApp.h"
#include "ofMain.h"

int main(int argc, char* argv[]) {
    ofGLWindowSettings settings;
    settings.setSize(1280, 720);
    settings.windowMode = OF_WINDOW;
    settings.title = "BHVD";

    auto window = ofCreateWindow(settings);

    // argv[1] may carry a bhvd://session deep link from the OS launcher.
    std::string launchUri = (argc > 1) ? argv[1] : "";
    ofRunApp(window, std::make_shared<ofApp>(launchUri));
    ofRunMainLoop();
    return 0;
}
