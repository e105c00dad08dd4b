// Board_Pins.h
// Pin and peripheral mapping for the CH32V203 node board.

#pragma once

// User button, closes to GND (internal pull-up, active LOW)
#ifndef NODE_PIN_BUTTON
#define NODE_PIN_BUTTON PB12
#endif

// Mainboard NeoPixel chain on PD1 (needs the PD0/PD1 remap)
#ifndef NODE_PIN_LED
#define NODE_PIN_LED PD1
#endif
#define NODE_LED_COUNT 2
#define NODE_LED_STATUS 0   // green while logging
#define NODE_LED_FAULT 1    // red in the error state
#define NODE_LED_BRIGHTNESS 35

// GPS module on USART2: TX -> PA2, RX -> PA3
#define NODE_GPS_BAUD 9600

// Debug log on the Arduino Serial port (USART1)
#define NODE_LOG_BAUD 115200

// Floating analog input sampled for the random seed (ADC1 channel 1, PA1)
#define NODE_ENTROPY_ADC_CHANNEL ADC_Channel_1
