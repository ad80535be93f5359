#include <main/tasks/acquisition_task.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <main/utils/watchdog.hpp>

namespace {
    static const char* TAG = "ACQ_TASK";

    // Static task resources
    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[Config::Tasks::Acquisition::stack_bytes / sizeof(StackType_t)];
    static StaticSemaphore_t s_stopped_buffer;
    static SemaphoreHandle_t s_stopped = nullptr;
    static TaskHandle_t s_task = nullptr;

    static AcquisitionLoop* s_loop = nullptr;
    static Scheduler* s_scheduler = nullptr;

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Acquisition Task started");
        if (Config::Features::enable_watchdog) {
            Watchdog::subscribe();
        }

        s_loop->run();

        if (Config::Features::enable_watchdog) {
            Watchdog::unsubscribe();
        }
        LOG_INFO(TAG, "%s", "Acquisition Task finished");
        xSemaphoreGive(s_stopped);
        s_task = nullptr;
        vTaskDelete(nullptr);
    }
}

namespace AcquisitionTask {
    void create(AcquisitionLoop& loop, Scheduler& scheduler) {
        s_loop = &loop;
        s_scheduler = &scheduler;
        s_stopped = xSemaphoreCreateBinaryStatic(&s_stopped_buffer);
        s_task = xTaskCreateStatic(taskFunction, "acquisition",
                                   sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                                   tskIDLE_PRIORITY + Config::Tasks::Acquisition::priority_above_idle,
                                   s_task_stack, &s_task_tcb);
    }

    bool stop(uint32_t timeout_ms) {
        if (s_scheduler == nullptr || s_stopped == nullptr) {
            return true;
        }
        s_scheduler->cancel();
        if (s_task == nullptr) {
            return true;
        }
        if (xSemaphoreTake(s_stopped, pdMS_TO_TICKS(timeout_ms)) != pdTRUE) {
            LOG_WARN(TAG, "Task did not stop within %lu ms", static_cast<unsigned long>(timeout_ms));
            return false;
        }
        return true;
    }
}
