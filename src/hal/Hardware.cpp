#include "Hardware.h"
#include "Board_Pins.h"
#include "Adafruit_NeoPixel.h"

// LED Configuration
Adafruit_NeoPixel strip_PD1(NODE_LED_COUNT, NODE_PIN_LED, NEO_GRB + NEO_KHZ800);

// ADC Configuration
#define ADC_ENTROPY_SAMPLES 64
volatile uint16_t ADC_data[ADC_ENTROPY_SAMPLES];

// 64 bit time base
static uint64_t time64_H = 0;
static uint32_t time64_L = 0;

namespace Hardware {

    void InitBase() {
        Watchdog_Disable(); // Disable WWDG first!
        System_Init();
        LED_Init();
        ADC_Init();
    }

    void Watchdog_Disable() {
        WWDG_DeInit();
        RCC_APB1PeriphClockCmd(RCC_APB1Periph_WWDG, DISABLE);
    }

    void System_Init() {
        RCC_APB2PeriphClockCmd(RCC_APB2Periph_AFIO, ENABLE);
        GPIO_PinRemapConfig(GPIO_Remap_PD01, ENABLE);
    }

    void DelayUS(uint32_t time) {
        delayMicroseconds(time);
    }

    void DelayMS(uint32_t time) {
        delay(time);
    }

    // Must be called at least once every 49 days to catch the rollover.
    // The control loop calls it every few ms.
    uint64_t GetTime() {
        uint32_t T = millis();
        if (T < time64_L) {
            time64_H += 0x100000000ULL;
        }
        time64_L = T;
        return time64_H | time64_L;
    }

    void WaitForInterrupt() {
        // SysTick wakes us every ms at the latest
        __WFI();
    }

    // --- UART ---
    static void (*uart_rx_callback)(uint8_t) = nullptr;

    void UART_SetRxCallback(void (*callback)(uint8_t)) {
        uart_rx_callback = callback;
    }

    void UART_Init(uint32_t baud) {
        GPIO_InitTypeDef GPIO_InitStructure = {0};
        USART_InitTypeDef USART_InitStructure = {0};
        NVIC_InitTypeDef NVIC_InitStructure = {0};

        RCC_APB1PeriphClockCmd(RCC_APB1Periph_USART2, ENABLE);
        RCC_APB2PeriphClockCmd(RCC_APB2Periph_GPIOA, ENABLE);

        /* USART2 TX-->A.2   RX-->A.3 */
        GPIO_InitStructure.GPIO_Pin = GPIO_Pin_2; // TX
        GPIO_InitStructure.GPIO_Speed = GPIO_Speed_50MHz;
        GPIO_InitStructure.GPIO_Mode = GPIO_Mode_AF_PP;
        GPIO_Init(GPIOA, &GPIO_InitStructure);
        GPIO_InitStructure.GPIO_Pin = GPIO_Pin_3; // RX
        GPIO_InitStructure.GPIO_Mode = GPIO_Mode_IN_FLOATING;
        GPIO_Init(GPIOA, &GPIO_InitStructure);

        USART_InitStructure.USART_BaudRate = baud;
        USART_InitStructure.USART_Parity = USART_Parity_No;
        USART_InitStructure.USART_WordLength = USART_WordLength_8b;
        USART_InitStructure.USART_StopBits = USART_StopBits_1;
        USART_InitStructure.USART_HardwareFlowControl = USART_HardwareFlowControl_None;
        USART_InitStructure.USART_Mode = USART_Mode_Tx | USART_Mode_Rx;

        USART_Init(USART2, &USART_InitStructure);
        USART_ITConfig(USART2, USART_IT_RXNE, ENABLE);

        NVIC_InitStructure.NVIC_IRQChannel = USART2_IRQn;
        NVIC_InitStructure.NVIC_IRQChannelPreemptionPriority = 0;
        NVIC_InitStructure.NVIC_IRQChannelSubPriority = 0;
        NVIC_InitStructure.NVIC_IRQChannelCmd = ENABLE;
        NVIC_Init(&NVIC_InitStructure);

        USART_Cmd(USART2, ENABLE);
    }

    extern "C" void USART2_IRQHandler(void) __attribute__((interrupt("WCH-Interrupt-fast")));
    void USART2_IRQHandler(void)
    {
        volatile uint32_t sr = USART2->STATR; // Read Status Register
        volatile uint32_t dr;

        // Reading SR then DR clears ORE, NE, FE, PE
        if ((sr & USART_FLAG_RXNE) || (sr & USART_FLAG_ORE))
        {
            dr = USART2->DATAR;
            if (sr & USART_FLAG_RXNE) {
                if (uart_rx_callback) uart_rx_callback((uint8_t)dr);
            }
        }
    }

    static bool UART_SendByte(uint8_t data) {
        uint32_t timeout = 10000;
        while (USART_GetFlagStatus(USART2, USART_FLAG_TXE) == RESET) {
            if (timeout-- == 0) return false;
            DelayUS(1);
        }
        USART_SendData(USART2, data);
        return true;
    }

    bool UART_Send(const uint8_t *data, uint16_t length) {
        for (uint16_t i = 0; i < length; i++) {
            if (!UART_SendByte(data[i])) return false;
        }
        return true;
    }

    bool UART_IsBusy() {
        return USART_GetFlagStatus(USART2, USART_FLAG_TC) == RESET;
    }

    // --- ADC ---
    // Continuous conversion of one floating input into a circular DMA buffer.
    // Only the LSBs are used, as seed material.
    void ADC_Init() {
        // GPIO
        {
            RCC_APB2PeriphClockCmd(RCC_APB2Periph_GPIOA, ENABLE);
            GPIO_InitTypeDef GPIO_InitStructure;
            GPIO_InitStructure.GPIO_Mode = GPIO_Mode_AIN;
            GPIO_InitStructure.GPIO_Speed = GPIO_Speed_50MHz;
            GPIO_InitStructure.GPIO_Pin = GPIO_Pin_1;
            GPIO_Init(GPIOA, &GPIO_InitStructure);
        }

        // DMA
        {
            DMA_InitTypeDef DMA_InitStructure;
            RCC_AHBPeriphClockCmd(RCC_AHBPeriph_DMA1, ENABLE);
            DMA_DeInit(DMA1_Channel1);
            DMA_InitStructure.DMA_PeripheralBaseAddr = (uint32_t)&ADC1->RDATAR;
            DMA_InitStructure.DMA_MemoryBaseAddr = (uint32_t)ADC_data;
            DMA_InitStructure.DMA_DIR = DMA_DIR_PeripheralSRC;
            DMA_InitStructure.DMA_BufferSize = ADC_ENTROPY_SAMPLES;
            DMA_InitStructure.DMA_PeripheralInc = DMA_PeripheralInc_Disable;
            DMA_InitStructure.DMA_MemoryInc = DMA_MemoryInc_Enable;
            DMA_InitStructure.DMA_PeripheralDataSize = DMA_PeripheralDataSize_HalfWord;
            DMA_InitStructure.DMA_MemoryDataSize = DMA_MemoryDataSize_HalfWord;
            DMA_InitStructure.DMA_Mode = DMA_Mode_Circular;
            DMA_InitStructure.DMA_Priority = DMA_Priority_Low;
            DMA_InitStructure.DMA_M2M = DMA_M2M_Disable;
            DMA_Init(DMA1_Channel1, &DMA_InitStructure);
            DMA_Cmd(DMA1_Channel1, ENABLE);
        }

        // ADC
        {
            ADC_DeInit(ADC1);
            RCC_ADCCLKConfig(RCC_PCLK2_Div8);
            RCC_APB2PeriphClockCmd(RCC_APB2Periph_ADC1, ENABLE);
            ADC_InitTypeDef ADC_InitStructure;
            ADC_InitStructure.ADC_Mode = ADC_Mode_Independent;
            ADC_InitStructure.ADC_ScanConvMode = DISABLE;
            ADC_InitStructure.ADC_ContinuousConvMode = ENABLE;
            ADC_InitStructure.ADC_ExternalTrigConv = ADC_ExternalTrigConv_None;
            ADC_InitStructure.ADC_DataAlign = ADC_DataAlign_Right;
            ADC_InitStructure.ADC_NbrOfChannel = 1;
            ADC_Init(ADC1, &ADC_InitStructure);

            ADC_Cmd(ADC1, ENABLE);
            ADC_BufferCmd(ADC1, DISABLE);

            ADC_ResetCalibration(ADC1);
            while (ADC_GetResetCalibrationStatus(ADC1));
            ADC_StartCalibration(ADC1);
            while (ADC_GetCalibrationStatus(ADC1));
            // Shortest sample time gives the noisiest LSBs
            ADC_RegularChannelConfig(ADC1, NODE_ENTROPY_ADC_CHANNEL, 1, ADC_SampleTime_1Cycles5);
            ADC_DMACmd(ADC1, ENABLE);
            ADC_SoftwareStartConvCmd(ADC1, ENABLE);
        }
        DelayMS(2); // Let the DMA buffer fill once
    }

    uint32_t ADC_CollectEntropy() {
        uint32_t seed = 0;
        for (int i = 0; i < ADC_ENTROPY_SAMPLES; i++) {
            seed = (seed << 1) | (seed >> 31);
            seed ^= ADC_data[i] & 0x3;
        }
        seed ^= (uint32_t)micros();
        return seed;
    }

    // --- LED ---
    void LED_Init() {
        strip_PD1.begin();
        strip_PD1.setBrightness(NODE_LED_BRIGHTNESS);
        strip_PD1.clear();
        strip_PD1.show();
    }

    void LED_SetColor(int led_idx, uint8_t r, uint8_t g, uint8_t b) {
        strip_PD1.setPixelColor(led_idx, strip_PD1.Color(r, g, b));
    }

    void LED_Show() {
        strip_PD1.show();
    }
}
