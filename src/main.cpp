#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <glm/glm.hpp>

#include <iostream>
#include <vector>
#include <string>
#include <cmath>
#include <exception>

#include "AppConfig.h"
#include "Camera.h"
#include "CameraController.h"
#include "FrameTimer.h"
#include "Projection.h"
#include "Uniforms.h"
#include "UniformBuffer.h"
#include "Shader.h"
#include "Texture.h"
#include "Mesh.h"
#include "Model.h"
#include "ModelData.h"

#include "imgui.h"
#include "backends/imgui_impl_glfw.h"
#include "backends/imgui_impl_opengl3.h"

static constexpr GLuint kCameraBinding = 0;
static constexpr GLuint kLightBinding = 1;

struct ViewerState {
    Camera cam;
    Projection proj;
    CameraController controller;

    bool mouseCaptured = true;
    bool firstMouse = true;
    double lastX = 0.0, lastY = 0.0;

    int textureSource = 0;   // 0 = model materials, then one per standalone texture
    int textureSourceCount = 1;

    ViewerState(const AppConfig& cfg)
        : cam(glm::vec3(0.0f, 1.0f, 2.0f), -1.57079632679f, -0.46f),
          proj((uint32_t)cfg.width, (uint32_t)cfg.height, glm::radians(cfg.fovyDeg), cfg.znear, cfg.zfar),
          controller(cfg.moveSpeed, cfg.sensitivity) {}
};

static ViewerState* stateOf(GLFWwindow* w)
{
    return static_cast<ViewerState*>(glfwGetWindowUserPointer(w));
}

static Key toKey(int glfwKey)
{
    switch (glfwKey)
    {
    case GLFW_KEY_W: return Key::W;
    case GLFW_KEY_A: return Key::A;
    case GLFW_KEY_S: return Key::S;
    case GLFW_KEY_D: return Key::D;
    case GLFW_KEY_UP: return Key::Up;
    case GLFW_KEY_DOWN: return Key::Down;
    case GLFW_KEY_LEFT: return Key::Left;
    case GLFW_KEY_RIGHT: return Key::Right;
    case GLFW_KEY_SPACE: return Key::Space;
    case GLFW_KEY_LEFT_SHIFT: return Key::LeftShift;
    case GLFW_KEY_I: return Key::I;
    case GLFW_KEY_J: return Key::J;
    case GLFW_KEY_K: return Key::K;
    case GLFW_KEY_L: return Key::L;
    default: return Key::Unknown;
    }
}

static void setCaptured(GLFWwindow *w, ViewerState &st, bool captured)
{
    st.mouseCaptured = captured;
    st.firstMouse = true;
    glfwSetInputMode(w, GLFW_CURSOR, captured ? GLFW_CURSOR_DISABLED : GLFW_CURSOR_NORMAL);
}

static void framebuffer_size_callback(GLFWwindow *w, int width, int height)
{
    // minimised windows report 0x0
    if (width <= 0 || height <= 0)
        return;
    glViewport(0, 0, width, height);
    stateOf(w)->proj.resize((uint32_t)width, (uint32_t)height);
}

static void key_callback(GLFWwindow *w, int key, int, int action, int)
{
    ViewerState &st = *stateOf(w);
    const bool down = action != GLFW_RELEASE;

    if (action == GLFW_PRESS)
    {
        if (key == GLFW_KEY_ESCAPE)
        {
            glfwSetWindowShouldClose(w, true);
            return;
        }
        if (key == GLFW_KEY_TAB)
        {
            setCaptured(w, st, !st.mouseCaptured);
            return;
        }
        if (key == GLFW_KEY_T)
        {
            st.textureSource = (st.textureSource + 1) % st.textureSourceCount;
            return;
        }
    }

    // releases always go through so no flag stays stuck under the UI
    if (down && ImGui::GetCurrentContext() && ImGui::GetIO().WantCaptureKeyboard)
        return;
    st.controller.onKey(toKey(key), down);
}

static void mouse_callback(GLFWwindow *w, double xpos, double ypos)
{
    ViewerState &st = *stateOf(w);
    if (!st.mouseCaptured)
        return;

    if (st.firstMouse)
    {
        st.lastX = xpos;
        st.lastY = ypos;
        st.firstMouse = false;
    }
    float dx = (float)(xpos - st.lastX);
    float dy = (float)(ypos - st.lastY);
    st.lastX = xpos;
    st.lastY = ypos;

    st.controller.onMouseMove(dx, dy);
}

static void scroll_callback(GLFWwindow *w, double, double yoff)
{
    if (ImGui::GetCurrentContext() && ImGui::GetIO().WantCaptureMouse)
        return;
    stateOf(w)->controller.onScroll((float)yoff, ScrollUnit::Lines);
}

static Mesh makeGroundQuad(float halfExtent, float y, float uvRepeat)
{
    std::vector<SimpleVertex> v = {
        {{-halfExtent, y, -halfExtent}, {0.0f, uvRepeat}},
        {{-halfExtent, y,  halfExtent}, {0.0f, 0.0f}},
        {{ halfExtent, y,  halfExtent}, {uvRepeat, 0.0f}},
        {{ halfExtent, y, -halfExtent}, {uvRepeat, uvRepeat}},
    };
    std::vector<uint32_t> idx = {0, 1, 2, 0, 2, 3};

    Mesh m;
    m.upload(v, idx);
    return m;
}

static int run(const AppConfig &cfg)
{
    ViewerState st(cfg);

    if (!glfwInit())
    {
        std::cerr << "Failed to init GLFW\n";
        return 1;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 5);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_SRGB_CAPABLE, GLFW_TRUE);

    GLFWwindow *window = glfwCreateWindow(cfg.width, cfg.height, cfg.title.c_str(), nullptr, nullptr);
    if (!window)
    {
        std::cerr << "Failed to create GLFW window (OpenGL 4.5 core required)\n";
        glfwTerminate();
        return 1;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(cfg.vsync ? 1 : 0);

    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress))
    {
        std::cerr << "Failed to init GLAD\n";
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    int exitCode = 0;
    {
        glfwSetWindowUserPointer(window, &st);

        int fbW = 0, fbH = 0;
        glfwGetFramebufferSize(window, &fbW, &fbH);
        if (fbW > 0 && fbH > 0)
            st.proj.resize((uint32_t)fbW, (uint32_t)fbH);

        glfwSetFramebufferSizeCallback(window, framebuffer_size_callback);
        glfwSetKeyCallback(window, key_callback);
        glfwSetCursorPosCallback(window, mouse_callback);
        glfwSetScrollCallback(window, scroll_callback);
        setCaptured(window, st, true);

        // projection emits depth in [0,1]
        glClipControl(GL_LOWER_LEFT, GL_ZERO_TO_ONE);
        glClearDepth(1.0);
        glEnable(GL_DEPTH_TEST);
        glDepthFunc(GL_LESS);
        glEnable(GL_FRAMEBUFFER_SRGB);

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGui::StyleColorsDark();
        ImGui_ImplGlfw_InitForOpenGL(window, true);
        ImGui_ImplOpenGL3_Init("#version 450");

        Shader modelSh;
        Model model;
        std::vector<Texture2D> textures;
        Mesh ground;

        const std::string modelPath = cfg.resolvedModelPath();
        if (!modelSh.load(pathJoin(cfg.shaderDir, "model.vert"), pathJoin(cfg.shaderDir, "model.frag")))
        {
            std::cerr << "Failed to build shader program from " << cfg.shaderDir << "\n";
            exitCode = 1;
        }
        else if (!model.loadFromFile(modelPath))
        {
            std::cerr << "Failed to load model: " << modelPath << "\n";
            exitCode = 1;
        }

        if (exitCode == 0)
        {
            if (!modelSh.bindUniformBlock("Camera", kCameraBinding))
                std::cerr << "Shader does not read the camera block\n";
            if (!modelSh.bindUniformBlock("Light", kLightBinding))
                std::cerr << "Shader does not declare the light block\n";

            std::vector<std::string> textureNames;
            for (const auto &path : cfg.resolvedTexturePaths())
            {
                Texture2D t;
                if (t.loadFromFile(path, true))
                {
                    textures.push_back(t);
                    textureNames.push_back(path);
                }
            }
            st.textureSourceCount = 1 + (int)textures.size();
            ground = makeGroundQuad(5.0f, -0.501f, 5.0f);

            UniformBuffer cameraUbo;
            cameraUbo.init(sizeof(CameraUniform), kCameraBinding);
            UniformBuffer lightUbo;
            lightUbo.init(sizeof(LightUniform), kLightBinding);

            CameraUniform cameraUniform;
            LightUniform light;
            if (!lightUbo.write(light))
                exitCode = 1;

            FrameTimer frameTimer(glfwGetTime());

            while (exitCode == 0 && !glfwWindowShouldClose(window))
            {
                const float dt = frameTimer.tick(glfwGetTime());

                st.controller.tick(st.cam, dt);
                cameraUniform.updateViewProj(st.cam, st.proj);
                if (!cameraUbo.write(cameraUniform))
                {
                    exitCode = 1;
                    break;
                }

                ImGui_ImplOpenGL3_NewFrame();
                ImGui_ImplGlfw_NewFrame();
                ImGui::NewFrame();

                ImGui::Begin("Camera");
                ImGui::Text("%.1f fps", ImGui::GetIO().Framerate);
                ImGui::Text("Pos: %.2f, %.2f, %.2f", st.cam.position.x, st.cam.position.y, st.cam.position.z);
                ImGui::Text("Yaw/Pitch: %.1f, %.1f deg", glm::degrees(st.cam.yaw()), glm::degrees(st.cam.pitch()));
                ImGui::Text("Aspect: %.3f", st.proj.aspect());
                ImGui::Text("Model: %zu meshes, %zu materials", model.meshCount(), model.materialCount());

                ImGui::Separator();
                ImGui::SliderFloat("Move speed", &st.controller.moveSpeed, 0.5f, 20.0f, "%.1f");
                ImGui::SliderFloat("Rotate speed", &st.controller.rotateSpeed, 0.1f, 4.0f, "%.2f");
                ImGui::SliderFloat("Sensitivity", &st.controller.sensitivity, 0.05f, 2.0f, "%.2f");

                ImGui::Separator();
                ImGui::Text("Texture [T]: %s",
                            st.textureSource == 0 ? "model materials" : textureNames[(size_t)st.textureSource - 1].c_str());
                ImGui::Text("Tab: %s mouse", st.mouseCaptured ? "release" : "capture");
                ImGui::End();

                const double t = frameTimer.elapsed();
                glClearColor((float)std::fabs(std::sin(t)), 1.0f, (float)std::fabs(std::cos(t)), 1.0f);
                glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

                modelSh.use();
                const Texture2D *overrideTex =
                    st.textureSource == 0 ? nullptr : &textures[(size_t)st.textureSource - 1];
                model.draw(modelSh, overrideTex, 0);

                if (!textures.empty())
                {
                    modelSh.setBool("uHasTex", true);
                    textures.back().bind(0);
                    ground.draw();
                    glBindTexture(GL_TEXTURE_2D, 0);
                }

                ImGui::Render();
                ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

                glfwSwapBuffers(window);
                glfwPollEvents();
            }
        }

        for (auto &t : textures)
            t.destroy();

        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();

        glfwSetWindowUserPointer(window, nullptr);
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    return exitCode;
}

int main(int argc, char **argv)
{
    AppConfig cfg;
    std::string error;
    switch (parseArgs(argc, argv, cfg, error))
    {
    case ParseResult::Help:
        std::cout << usageText();
        return 0;
    case ParseResult::Error:
        std::cerr << "[Config] " << error << "\n" << usageText();
        return 1;
    case ParseResult::Ok:
        break;
    }

    try
    {
        return run(cfg);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
