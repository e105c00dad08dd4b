#pragma once

#include <Arduino.h>
#include <stdint.h>
#include "ch32v20x.h"

// Hardware Abstraction Layer
// Thin register level helpers used by the Board_* adapters only.
// Nothing above src/hal/ may include this file.

namespace Hardware {

    void InitBase();

    // Time
    void DelayUS(uint32_t us);
    void DelayMS(uint32_t ms);
    uint64_t GetTime(); // ms since boot, 64 bit (handles millis() rollover)
    void WaitForInterrupt();

    // UART (GPS link)
    void UART_Init(uint32_t baud);
    void UART_SetRxCallback(void (*callback)(uint8_t));
    bool UART_Send(const uint8_t *data, uint16_t length); // false on TX timeout
    bool UART_IsBusy();

    // ADC
    void ADC_Init();
    uint32_t ADC_CollectEntropy();

    // LED
    void LED_Init();
    void LED_SetColor(int led_idx, uint8_t r, uint8_t g, uint8_t b);
    void LED_Show();

    // Watchdog
    void Watchdog_Disable();

    // System
    void System_Init(); // Configures RCC, GPIO remap, etc.
}
